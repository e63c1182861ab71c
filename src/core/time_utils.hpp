#ifndef SYMPTOMOPS_CORE_TIME_UTILS_HPP_
#define SYMPTOMOPS_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace symptomops::core {

// Canonical UTC timestamp formatter used by logs, events and artifacts.
// Millisecond precision keeps cross-source event timelines comparable.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Short age label used by `list-deployments` (`42s`, `7m`, `3h`, `12d`).
inline std::string FormatAge(std::chrono::system_clock::time_point since,
                             std::chrono::system_clock::time_point now) {
  const auto elapsed = now > since ? now - since : std::chrono::system_clock::duration::zero();
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  if (seconds < 60) {
    return std::to_string(seconds) + "s";
  }
  if (seconds < 3600) {
    return std::to_string(seconds / 60) + "m";
  }
  if (seconds < 86400) {
    return std::to_string(seconds / 3600) + "h";
  }
  return std::to_string(seconds / 86400) + "d";
}

// Human duration with two decimals in the largest fitting unit
// (`1.25s`, `3.50m`, `1.02h`).
inline std::string FormatDuration(std::chrono::milliseconds duration) {
  const double millis = static_cast<double>(duration.count());
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  if (millis < 60'000.0) {
    out << millis / 1'000.0 << 's';
  } else if (millis < 3'600'000.0) {
    out << millis / 60'000.0 << 'm';
  } else {
    out << millis / 3'600'000.0 << 'h';
  }
  return out.str();
}

} // namespace symptomops::core

#endif // SYMPTOMOPS_CORE_TIME_UTILS_HPP_
