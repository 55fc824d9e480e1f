#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_input;
    std::string stream_success;
    std::string stream_failure;
    std::string consumer_group;
    std::string consumer_name;
    int read_count;
    int read_block_ms;

    // Reconnect
    std::string backoff_strategy;  // "fixed" or "exponential"
    int backoff_base_ms;
    int backoff_max_ms;
    double backoff_multiplier;
    int reconnect_alert_threshold;

    // Scoring
    std::string no_dex_policy;  // "empty_success" or "failure"

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string service_version;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
