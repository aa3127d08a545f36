#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ollama {

/**
 * How long the server keeps a model loaded after a request.
 *
 * `Default` leaves the decision to the server (the field is omitted), `None`
 * unloads immediately, `Forever` never unloads. Construction normalizes:
 * zero seconds becomes `None` and any negative duration becomes `Forever`.
 */
class KeepAlive {
public:
  enum class Kind { Default, None, Seconds, Forever };

  KeepAlive() = default;

  static KeepAlive none() { return KeepAlive(Kind::None, 0); }
  static KeepAlive forever() { return KeepAlive(Kind::Forever, 0); }
  static KeepAlive seconds(std::int64_t seconds);
  static KeepAlive from(std::chrono::seconds duration) { return seconds(duration.count()); }

  /// Parses "300", "-1", "45s", "5m", "1h30m", "1.5h" or "250ms". Throws LocalValidationError.
  static KeepAlive parse(const std::string& text);

  Kind kind() const { return kind_; }
  bool is_default() const { return kind_ == Kind::Default; }

  /// Number of seconds for `Seconds`; 0 for every other kind.
  std::int64_t seconds_value() const { return seconds_; }

  /// Wire value: 0 for None, -1 for Forever, the seconds count otherwise; nullopt for Default.
  std::optional<nlohmann::json> to_json() const;

  friend bool operator==(const KeepAlive& lhs, const KeepAlive& rhs) {
    return lhs.kind_ == rhs.kind_ && lhs.seconds_ == rhs.seconds_;
  }
  friend bool operator!=(const KeepAlive& lhs, const KeepAlive& rhs) { return !(lhs == rhs); }

private:
  KeepAlive(Kind kind, std::int64_t seconds) : kind_(kind), seconds_(seconds) {}

  Kind kind_ = Kind::Default;
  std::int64_t seconds_ = 0;
};

}  // namespace ollama
