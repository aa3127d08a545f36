#include "ollama/options.hpp"

#include <algorithm>
#include <type_traits>

namespace ollama {
namespace {

using json = nlohmann::json;

json entries_to_json(const OptionValue::Entries& entries) {
  json object = json::object();
  for (const auto& [key, value] : entries) {
    object[key] = value.to_json();
  }
  return object;
}

}  // namespace

json OptionValue::to_json() const {
  return std::visit(
      [](const auto& value) -> json {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, List>) {
          json array = json::array();
          for (const auto& item : value) {
            array.push_back(item.to_json());
          }
          return array;
        } else if constexpr (std::is_same_v<T, Entries>) {
          return entries_to_json(value);
        } else {
          return json(value);
        }
      },
      value_);
}

Options::Options(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

Options& Options::set(const std::string& key, OptionValue value) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) { return entry.first == key; });
  if (it != entries_.end()) {
    it->second = std::move(value);
  } else {
    entries_.emplace_back(key, std::move(value));
  }
  return *this;
}

bool Options::erase(const std::string& key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) { return entry.first == key; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

const OptionValue* Options::find(const std::string& key) const {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) { return entry.first == key; });
  return it == entries_.end() ? nullptr : &it->second;
}

Options Options::merged_with(const Options& overrides) const {
  Options merged = *this;
  for (const auto& [key, value] : overrides) {
    merged.set(key, value);
  }
  return merged;
}

json Options::to_json() const {
  return entries_to_json(entries_);
}

}  // namespace ollama
