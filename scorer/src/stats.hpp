#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

struct StatsSnapshot {
    uint64_t processed_count = 0;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    std::optional<int64_t> last_processed_timestamp;

    nlohmann::json to_json() const;
};

// Processing counters. Written by the stream processor, read by the
// status API.
class StatsTracker {
public:
    void record_success(int64_t message_timestamp);
    void record_failure(int64_t message_timestamp);

    StatsSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    StatsSnapshot stats_;
};
