#pragma once

#include <chrono>
#include <string>

namespace verirag::time {

// Formats a UTC time point as ISO-8601 with millisecond precision.
std::string format_iso8601(std::chrono::system_clock::time_point point);

std::string current_time_iso8601();

// Milliseconds elapsed since the given steady-clock instant.
long long elapsed_ms(std::chrono::steady_clock::time_point start);

}  // namespace verirag::time
