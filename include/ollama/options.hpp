#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ollama {

/// Value of a model tuning parameter: bool, integer, float, string, list, or nested mapping.
class OptionValue {
public:
  using List = std::vector<OptionValue>;
  using Entries = std::vector<std::pair<std::string, OptionValue>>;
  using Storage = std::variant<bool, std::int64_t, double, std::string, List, Entries>;

  OptionValue() : value_(std::string()) {}
  OptionValue(bool value) : value_(value) {}
  OptionValue(int value) : value_(static_cast<std::int64_t>(value)) {}
  OptionValue(std::int64_t value) : value_(value) {}
  OptionValue(double value) : value_(value) {}
  OptionValue(const char* value) : value_(std::string(value)) {}
  OptionValue(std::string value) : value_(std::move(value)) {}
  OptionValue(List value) : value_(std::move(value)) {}
  OptionValue(Entries value) : value_(std::move(value)) {}

  bool is_bool() const { return std::holds_alternative<bool>(value_); }
  bool is_integer() const { return std::holds_alternative<std::int64_t>(value_); }
  bool is_float() const { return std::holds_alternative<double>(value_); }
  bool is_string() const { return std::holds_alternative<std::string>(value_); }
  bool is_list() const { return std::holds_alternative<List>(value_); }
  bool is_mapping() const { return std::holds_alternative<Entries>(value_); }

  const Storage& storage() const { return value_; }

  nlohmann::json to_json() const;

  friend bool operator==(const OptionValue& lhs, const OptionValue& rhs) { return lhs.value_ == rhs.value_; }
  friend bool operator!=(const OptionValue& lhs, const OptionValue& rhs) { return !(lhs == rhs); }

private:
  Storage value_;
};

/**
 * Insertion-ordered mapping of tuning parameters (temperature, num_ctx, stop, ...).
 * Setting an existing key replaces its value in place.
 */
class Options {
public:
  using Entry = std::pair<std::string, OptionValue>;

  Options() = default;
  Options(std::initializer_list<Entry> entries);

  Options& set(const std::string& key, OptionValue value);
  bool erase(const std::string& key);

  const OptionValue* find(const std::string& key) const;
  bool contains(const std::string& key) const { return find(key) != nullptr; }

  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }

  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

  /// Returns a copy of these options with every key of `overrides` applied on top.
  Options merged_with(const Options& overrides) const;

  nlohmann::json to_json() const;

  friend bool operator==(const Options& lhs, const Options& rhs) { return lhs.entries_ == rhs.entries_; }

private:
  std::vector<Entry> entries_;
};

}  // namespace ollama
