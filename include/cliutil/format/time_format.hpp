#pragma once

#include <chrono>
#include <string>

namespace cliutil {
namespace format {

// Units naming levels for formatDuration:
//   0 - clock style "01:02:05" (days and weeks as "1d", "1w")
//   1 - "1h 2m 5s"
//   2 - "1 hr 2 min 5 sec"
//   3 - "1 hour 2 minutes 5 seconds"
// A value whose last digit is not 1 takes the plural unit name, so 11 and 21
// are rendered with plural-less names ("11 second"). Kept for output compatibility.
std::string formatDuration(double seconds,
                           int precision = 0,
                           bool strip_empty_units = true,
                           int units_naming_level = 3,
                           bool two_digit_hms = false);

std::string formatTimestamp(std::chrono::system_clock::time_point when, const std::string& format);

std::string formatCurrentTime(const std::string& format);

}}
