#include "stats.hpp"

nlohmann::json StatsSnapshot::to_json() const {
    nlohmann::json j = {
        {"processed_count", processed_count},
        {"success_count", success_count},
        {"failure_count", failure_count},
        {"last_processed_timestamp", nullptr}
    };
    if (last_processed_timestamp) {
        j["last_processed_timestamp"] = *last_processed_timestamp;
    }
    return j;
}

void StatsTracker::record_success(int64_t message_timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.processed_count++;
    stats_.success_count++;
    stats_.last_processed_timestamp = message_timestamp;
}

void StatsTracker::record_failure(int64_t message_timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.processed_count++;
    stats_.failure_count++;
    stats_.last_processed_timestamp = message_timestamp;
}

StatsSnapshot StatsTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}
