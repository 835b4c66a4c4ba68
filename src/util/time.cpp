#include "util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace courserag::time {

std::string current_time_iso8601() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto now_seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - now_seconds).count();

    const std::time_t time_t_value = clock::to_time_t(now_seconds);
    std::tm tm_buffer{};
    gmtime_r(&time_t_value, &tm_buffer);

    std::ostringstream oss;
    oss << std::put_time(&tm_buffer, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

}  // namespace courserag::time
