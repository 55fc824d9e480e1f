#pragma once

#include "message_channel.hpp"
#include "stats.hpp"
#include "stream_processor.hpp"
#include <string>
#include <nlohmann/json.hpp>

struct ServiceInfo {
    std::string name;
    std::string version;
};

// Bodies for the status endpoints. Reads processor state and stats only.
class HealthCheck {
public:
    HealthCheck(const ServiceInfo& info, MessageChannel& channel,
                const StreamProcessor& processor, const StatsTracker& stats)
        : info_(info), channel_(channel), processor_(processor), stats_(stats) {}

    nlohmann::json get_root() const;
    nlohmann::json get_status() const;
    nlohmann::json get_stats() const;
    bool is_healthy() const;

private:
    ServiceInfo info_;
    MessageChannel& channel_;
    const StreamProcessor& processor_;
    const StatsTracker& stats_;
};
