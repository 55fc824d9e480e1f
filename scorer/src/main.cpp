#include "backoff.hpp"
#include "config.hpp"
#include "health.hpp"
#include "redis_bus.hpp"
#include "scoring.hpp"
#include "stats.hpp"
#include "stream_processor.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("reputation_scorer", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("Starting {} v{} on {}:{}", config.service_name, config.service_version,
                     config.listen_addr, config.listen_port);

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        StreamNames streams{config.stream_input, config.stream_success, config.stream_failure,
                            config.consumer_group, config.consumer_name};
        auto redis = std::make_unique<RedisBus>(config.redis_url, streams);

        ReputationScorer scorer;
        StatsTracker stats;
        BackoffPolicy backoff(parse_backoff_strategy(config.backoff_strategy),
                              std::chrono::milliseconds(config.backoff_base_ms),
                              std::chrono::milliseconds(config.backoff_max_ms),
                              config.backoff_multiplier);

        ProcessorOptions options;
        options.read_count = config.read_count;
        options.read_block_ms = config.read_block_ms;
        options.no_dex_policy = parse_no_dex_policy(config.no_dex_policy);
        options.reconnect_alert_threshold = config.reconnect_alert_threshold;

        StreamProcessor processor(*redis, scorer, stats, backoff, options);
        HealthCheck health({config.service_name, config.service_version}, *redis, processor, stats);

        httplib::Server server;

        server.Get("/", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.get_root().dump(), "application/json");
        });

        server.Get("/api/v1/health", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.get_status().dump(), "application/json");
            res.status = health.is_healthy() ? 200 : 503;
        });

        server.Get("/api/v1/stats", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.get_stats().dump(), "application/json");
        });

        std::thread http_thread([&server, &config]() {
            spdlog::info("HTTP server listening on {}:{}", config.listen_addr, config.listen_port);
            if (!server.listen(config.listen_addr.c_str(), config.listen_port)) {
                spdlog::error("HTTP server failed to listen on {}:{}",
                              config.listen_addr, config.listen_port);
            }
        });

        std::thread processor_thread([&processor]() { processor.run(); });

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown requested, stopping processor");
        processor.stop();
        if (processor_thread.joinable()) processor_thread.join();

        server.stop();
        if (http_thread.joinable()) http_thread.join();

        redis.reset();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
