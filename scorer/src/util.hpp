#pragma once

#include <cstdint>
#include <string>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    int64_t current_unix_seconds();

    // Fixed-point text with exactly `decimals` fractional digits
    std::string format_fixed(double value, int decimals);

    // Replaces invalid UTF-8 sequences with U+FFFD
    std::string to_valid_utf8(const std::string& text);

    // UTC calendar day index (floor division, valid for negative timestamps)
    int64_t utc_day(int64_t unix_seconds);

    // Milliseconds part of a Redis stream id ("1672531200000-0"), -1 if malformed
    int64_t stream_id_ms(const std::string& id);
}
