#include "util.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t current_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string format_fixed(double value, int decimals) {
    return fmt::format("{:.{}f}", value, decimals);
}

std::string to_valid_utf8(const std::string& text) {
    std::string quoted = nlohmann::json(text).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(quoted).get<std::string>();
}

int64_t utc_day(int64_t unix_seconds) {
    constexpr int64_t seconds_per_day = 86400;
    int64_t day = unix_seconds / seconds_per_day;
    if (unix_seconds % seconds_per_day < 0) {
        --day;
    }
    return day;
}

int64_t stream_id_ms(const std::string& id) {
    auto dash = id.find('-');
    std::string ms_part = id.substr(0, dash);
    if (ms_part.empty()) return -1;
    for (char c : ms_part) {
        if (c < '0' || c > '9') return -1;
    }
    try {
        return std::stoll(ms_part);
    } catch (const std::out_of_range&) {
        return -1;
    }
}

} // namespace util
