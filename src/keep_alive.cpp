#include "ollama/keep_alive.hpp"

#include "ollama/error.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace ollama {
namespace {

constexpr std::int64_t kForeverWire = -1;
// Largest magnitude representable as whole seconds in a signed 64-bit count.
constexpr double kMaxSeconds = 9.2e18;

std::optional<double> unit_seconds(const std::string& unit) {
  if (unit.empty() || unit == "s") return 1.0;
  if (unit == "ms") return 0.001;
  if (unit == "m") return 60.0;
  if (unit == "h") return 3600.0;
  return std::nullopt;
}

[[noreturn]] void throw_invalid(const std::string& text) {
  throw LocalValidationError("Invalid keep_alive duration: \"" + text + "\"");
}

}  // namespace

KeepAlive KeepAlive::seconds(std::int64_t seconds) {
  if (seconds == 0) {
    return none();
  }
  if (seconds < 0) {
    return forever();
  }
  return KeepAlive(Kind::Seconds, seconds);
}

KeepAlive KeepAlive::parse(const std::string& text) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  std::size_t end = text.size();
  while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  if (pos == end) {
    throw_invalid(text);
  }

  bool negative = false;
  if (text[pos] == '-' || text[pos] == '+') {
    negative = text[pos] == '-';
    ++pos;
  }

  double total = 0.0;
  bool any = false;
  while (pos < end) {
    const std::size_t number_start = pos;
    while (pos < end && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) ++pos;
    if (pos == number_start) {
      throw_invalid(text);
    }
    const std::string number = text.substr(number_start, pos - number_start);
    char* parsed_end = nullptr;
    const double value = std::strtod(number.c_str(), &parsed_end);
    if (parsed_end != number.c_str() + number.size()) {
      throw_invalid(text);
    }

    const std::size_t unit_start = pos;
    while (pos < end && std::isalpha(static_cast<unsigned char>(text[pos]))) ++pos;
    auto factor = unit_seconds(text.substr(unit_start, pos - unit_start));
    if (!factor) {
      throw_invalid(text);
    }
    total += value * *factor;
    any = true;
  }
  if (!any || !std::isfinite(total) || total >= kMaxSeconds) {
    throw_invalid(text);
  }

  if (negative && total > 0.0) {
    return forever();
  }
  // Sub-second durations still keep the model briefly rather than unloading it.
  auto whole = static_cast<std::int64_t>(std::ceil(total));
  return seconds(whole);
}

std::optional<nlohmann::json> KeepAlive::to_json() const {
  switch (kind_) {
    case Kind::Default:
      return std::nullopt;
    case Kind::None:
      return nlohmann::json(0);
    case Kind::Seconds:
      return nlohmann::json(seconds_);
    case Kind::Forever:
      return nlohmann::json(kForeverWire);
  }
  return std::nullopt;
}

}  // namespace ollama
