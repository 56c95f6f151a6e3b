#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace mds::util {

// Every timestamp in mdsync is a UTC instant at microsecond resolution.
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

[[nodiscard]] Timestamp now();

[[nodiscard]] Timestamp fromTimespec(const timespec& ts);

// "YYYY-MM-DDTHH:MM:SS.ffffffZ"
[[nodiscard]] std::string timestampToString(const Timestamp& ts);

// Accepts a trailing 'Z' or a numeric offset ("+02:00", "-0500") and up to nine
// fractional digits. Strings without a zone designator throw TimestampError.
[[nodiscard]] Timestamp parseTimestamp(std::string_view iso);

[[nodiscard]] std::string toString(const std::optional<Timestamp>& ts, std::string_view ifEmpty = "never");

} // namespace mds::util
