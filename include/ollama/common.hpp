#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ollama {

/// An image attached to a prompt: either base64 text as the server expects it, or raw bytes.
using Image = std::variant<std::string, std::vector<std::uint8_t>>;

/// `think` request field: a plain switch, or an effort level ("high", "medium", "low").
using ThinkSetting = std::variant<bool, std::string>;

/// Timing and token counters reported on the final record of a generation. Durations are nanoseconds.
struct GenerationMetrics {
  std::optional<std::int64_t> total_duration;
  std::optional<std::int64_t> load_duration;
  std::optional<std::int64_t> prompt_eval_count;
  std::optional<std::int64_t> prompt_eval_duration;
  std::optional<std::int64_t> eval_count;
  std::optional<std::int64_t> eval_duration;
};

GenerationMetrics parse_generation_metrics(const nlohmann::json& payload);

nlohmann::json images_to_json(const std::vector<Image>& images);

nlohmann::json think_to_json(const ThinkSetting& think);

/// True when `think` asks the model for reasoning output.
bool think_enabled(const std::optional<ThinkSetting>& think);

}  // namespace ollama
