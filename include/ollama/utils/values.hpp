#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "ollama/error.hpp"

namespace ollama::utils {

bool is_absolute_url(std::string_view url);

template <typename Integer,
          typename = std::enable_if_t<std::is_integral_v<Integer>>>
Integer validate_positive_integer(const std::string& name, Integer value) {
  if (value <= 0) {
    throw LocalValidationError(name + " must be a positive integer");
  }
  return value;
}

std::optional<nlohmann::json> safe_json(const std::string& text);

std::int64_t coerce_integer(const nlohmann::json& value);
std::optional<std::int64_t> maybe_coerce_integer(const nlohmann::json& value);

/// Reads `key` from an object, treating absence and null alike.
std::optional<std::string> optional_string(const nlohmann::json& object, const std::string& key);
std::optional<std::int64_t> optional_integer(const nlohmann::json& object, const std::string& key);

/// Returns `object[key]`, raising DecodeError naming `context` when the field is absent or null.
const nlohmann::json& require_field(const nlohmann::json& object, const std::string& key, const std::string& context);

/// Checks the blob digest form `sha256:` followed by 64 lowercase hex characters.
bool is_valid_digest(std::string_view digest);

}  // namespace ollama::utils
