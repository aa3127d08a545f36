#include "ollama/utils/values.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ollama::utils {

bool is_absolute_url(std::string_view url) {
  auto colon_pos = url.find(':');
  if (colon_pos == std::string_view::npos) {
    return false;
  }
  if (colon_pos == 0) {
    return false;
  }

  unsigned char first = static_cast<unsigned char>(url[0]);
  if (!std::isalpha(first)) {
    return false;
  }

  for (std::size_t i = 1; i < colon_pos; ++i) {
    unsigned char ch = static_cast<unsigned char>(url[i]);
    if (!(std::isalnum(ch) || ch == '+' || ch == '.' || ch == '-')) {
      return false;
    }
  }

  return true;
}

std::optional<nlohmann::json> safe_json(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error&) {
    return std::nullopt;
  }
}

namespace {

[[noreturn]] void throw_coerce_error(const nlohmann::json& value, const std::string& type) {
  throw DecodeError("Could not coerce " + value.dump() + " (type: " + type + ") into an integer");
}

}  // namespace

std::int64_t coerce_integer(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    double number = value.get<double>();
    if (std::isnan(number) || !std::isfinite(number)) {
      throw_coerce_error(value, "number");
    }
    return static_cast<std::int64_t>(std::llround(number));
  }
  if (value.is_string()) {
    const auto& str = value.get_ref<const std::string&>();
    if (str.empty()) {
      throw_coerce_error(value, "string");
    }
    std::size_t idx = 0;
    std::int64_t result = 0;
    try {
      result = std::stoll(str, &idx, 10);
    } catch (const std::logic_error&) {
      throw_coerce_error(value, "string");
    }
    if (idx != str.size()) {
      throw_coerce_error(value, "string");
    }
    return result;
  }
  throw_coerce_error(value, value.type_name());
}

std::optional<std::int64_t> maybe_coerce_integer(const nlohmann::json& value) {
  if (value.is_null()) {
    return std::nullopt;
  }
  return coerce_integer(value);
}

std::optional<std::string> optional_string(const nlohmann::json& object, const std::string& key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw DecodeError("Expected field '" + key + "' to be a string");
  }
  return it->get<std::string>();
}

std::optional<std::int64_t> optional_integer(const nlohmann::json& object, const std::string& key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end()) {
    return std::nullopt;
  }
  return maybe_coerce_integer(*it);
}

const nlohmann::json& require_field(const nlohmann::json& object, const std::string& key, const std::string& context) {
  if (object.is_object()) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
      return *it;
    }
  }
  throw DecodeError(context + " is missing required field '" + key + "'");
}

bool is_valid_digest(std::string_view digest) {
  constexpr std::string_view kPrefix = "sha256:";
  constexpr std::size_t kHexLength = 64;
  if (digest.size() != kPrefix.size() + kHexLength || digest.substr(0, kPrefix.size()) != kPrefix) {
    return false;
  }
  for (char ch : digest.substr(kPrefix.size())) {
    const bool hex = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
    if (!hex) {
      return false;
    }
  }
  return true;
}

}  // namespace ollama::utils
