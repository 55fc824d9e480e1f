#include "health.hpp"

nlohmann::json HealthCheck::get_root() const {
    return {
        {"service", info_.name},
        {"version", info_.version},
        {"status", "running"}
    };
}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = channel_.ping();

    return {
        {"status", is_healthy() ? "ok" : "degraded"},
        {"redis", redis_ok},
        {"loop", to_string(processor_.state())}
    };
}

nlohmann::json HealthCheck::get_stats() const {
    return stats_.snapshot().to_json();
}

bool HealthCheck::is_healthy() const {
    ProcessorState state = processor_.state();
    return !processor_.degraded() &&
           state != ProcessorState::Stopping &&
           state != ProcessorState::Stopped;
}
