#include "config.hpp"
#include "backoff.hpp"
#include "stream_processor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "tcp://127.0.0.1:6379");
    cfg.stream_input = get_env("STREAM_INPUT", "wallet-transactions");
    cfg.stream_success = get_env("STREAM_SUCCESS", "wallet-scores-success");
    cfg.stream_failure = get_env("STREAM_FAILURE", "wallet-scores-failure");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "reputation-scorer-group");
    cfg.consumer_name = get_env("CONSUMER_NAME", "reputation-scorer-1");
    cfg.read_count = get_env_int("READ_COUNT", 10);
    cfg.read_block_ms = get_env_int("READ_BLOCK_MS", 1000);

    cfg.backoff_strategy = get_env("BACKOFF_STRATEGY", "fixed");
    cfg.backoff_base_ms = get_env_int("BACKOFF_BASE_MS", 5000);
    cfg.backoff_max_ms = get_env_int("BACKOFF_MAX_MS", 60000);
    cfg.backoff_multiplier = get_env_double("BACKOFF_MULTIPLIER", 2.0);
    cfg.reconnect_alert_threshold = get_env_int("RECONNECT_ALERT_THRESHOLD", 5);

    cfg.no_dex_policy = get_env("NO_DEX_POLICY", "empty_success");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8000);

    cfg.service_name = get_env("SERVICE_NAME", "DeFi Reputation Scoring Server");
    cfg.service_version = get_env("SERVICE_VERSION", "1.0.0");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (redis_url.empty()) {
        throw std::runtime_error("REDIS_URL is required");
    }
    if (stream_input.empty() || stream_success.empty() || stream_failure.empty()) {
        throw std::runtime_error("STREAM_INPUT, STREAM_SUCCESS and STREAM_FAILURE must be set");
    }
    if (stream_input == stream_success || stream_input == stream_failure ||
        stream_success == stream_failure) {
        throw std::runtime_error("Input, success and failure streams must be distinct");
    }
    if (consumer_group.empty() || consumer_name.empty()) {
        throw std::runtime_error("CONSUMER_GROUP and CONSUMER_NAME must be set");
    }
    if (read_count <= 0) {
        throw std::runtime_error("READ_COUNT must be positive");
    }
    if (read_block_ms <= 0) {
        throw std::runtime_error("READ_BLOCK_MS must be positive");
    }
    if (backoff_base_ms <= 0) {
        throw std::runtime_error("BACKOFF_BASE_MS must be positive");
    }
    if (backoff_max_ms < backoff_base_ms) {
        throw std::runtime_error("BACKOFF_MAX_MS must be >= BACKOFF_BASE_MS");
    }
    if (backoff_multiplier < 1.0) {
        throw std::runtime_error("BACKOFF_MULTIPLIER must be >= 1");
    }
    if (reconnect_alert_threshold <= 0) {
        throw std::runtime_error("RECONNECT_ALERT_THRESHOLD must be positive");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be in 1..65535");
    }

    try {
        parse_backoff_strategy(backoff_strategy);
        parse_no_dex_policy(no_dex_policy);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Streams: in={}, success={}, failure={}",
                 stream_input, stream_success, stream_failure);
    spdlog::info("  Consumer: group={}, name={}", consumer_group, consumer_name);
    spdlog::info("  Backoff: {} base={}ms max={}ms", backoff_strategy,
                 backoff_base_ms, backoff_max_ms);
    spdlog::info("  No-dex policy: {}", no_dex_policy);
}
