#pragma once

#include <chrono>
#include <string>

enum class BackoffStrategy {
    Fixed,
    Exponential
};

BackoffStrategy parse_backoff_strategy(const std::string& name);
const char* to_string(BackoffStrategy strategy);

// Reconnect delay after consecutive transport failures
class BackoffPolicy {
public:
    BackoffPolicy(BackoffStrategy strategy,
                  std::chrono::milliseconds base_delay,
                  std::chrono::milliseconds max_delay,
                  double multiplier = 2.0);

    // Record a failure and return the delay to wait before the next attempt
    std::chrono::milliseconds record_failure();

    // Reset after a successful reconnect
    void record_success();

    // Delay for the current failure count (zero when healthy)
    std::chrono::milliseconds next_delay() const;

    int consecutive_failures() const { return failure_count_; }
    BackoffStrategy strategy() const { return strategy_; }

private:
    std::chrono::milliseconds calculate_delay(int failure_count) const;

    BackoffStrategy strategy_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    double multiplier_;
    int failure_count_ = 0;
};
