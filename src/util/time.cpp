#include "util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace verirag::time {

std::string format_iso8601(std::chrono::system_clock::time_point point) {
    using clock = std::chrono::system_clock;
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(point);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(point - seconds).count();

    const std::time_t time_t_value = clock::to_time_t(seconds);
    std::tm tm_buffer{};
    gmtime_r(&time_t_value, &tm_buffer);

    std::ostringstream oss;
    oss << std::put_time(&tm_buffer, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::string current_time_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

long long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
        .count();
}

}  // namespace verirag::time
