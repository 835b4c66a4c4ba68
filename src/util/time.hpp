#pragma once

#include <chrono>
#include <string>

namespace courserag::time {

// Returns the current UTC time formatted as ISO-8601 with millisecond precision.
std::string current_time_iso8601();

// Milliseconds elapsed on the steady clock since start.
long elapsed_ms(std::chrono::steady_clock::time_point start);

}  // namespace courserag::time
