#include "ollama/common.hpp"

#include "ollama/utils/base64.hpp"
#include "ollama/utils/values.hpp"

namespace ollama {

using json = nlohmann::json;

GenerationMetrics parse_generation_metrics(const json& payload) {
  GenerationMetrics metrics;
  metrics.total_duration = utils::optional_integer(payload, "total_duration");
  metrics.load_duration = utils::optional_integer(payload, "load_duration");
  metrics.prompt_eval_count = utils::optional_integer(payload, "prompt_eval_count");
  metrics.prompt_eval_duration = utils::optional_integer(payload, "prompt_eval_duration");
  metrics.eval_count = utils::optional_integer(payload, "eval_count");
  metrics.eval_duration = utils::optional_integer(payload, "eval_duration");
  return metrics;
}

json images_to_json(const std::vector<Image>& images) {
  json array = json::array();
  for (const auto& image : images) {
    if (const auto* encoded = std::get_if<std::string>(&image)) {
      array.push_back(*encoded);
    } else {
      array.push_back(utils::encode_base64(std::get<std::vector<std::uint8_t>>(image)));
    }
  }
  return array;
}

json think_to_json(const ThinkSetting& think) {
  return std::visit([](const auto& value) -> json { return json(value); }, think);
}

bool think_enabled(const std::optional<ThinkSetting>& think) {
  if (!think) {
    return false;
  }
  if (const auto* flag = std::get_if<bool>(&*think)) {
    return *flag;
  }
  return !std::get<std::string>(*think).empty();
}

}  // namespace ollama
