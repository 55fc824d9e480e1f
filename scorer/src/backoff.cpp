#include "backoff.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

BackoffStrategy parse_backoff_strategy(const std::string& name) {
    if (name == "fixed") return BackoffStrategy::Fixed;
    if (name == "exponential") return BackoffStrategy::Exponential;
    throw std::invalid_argument("Unknown backoff strategy: " + name);
}

const char* to_string(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::Fixed: return "fixed";
        case BackoffStrategy::Exponential: return "exponential";
    }
    return "unknown";
}

BackoffPolicy::BackoffPolicy(BackoffStrategy strategy,
                             std::chrono::milliseconds base_delay,
                             std::chrono::milliseconds max_delay,
                             double multiplier)
    : strategy_(strategy),
      base_delay_(base_delay),
      max_delay_(std::max(base_delay, max_delay)),
      multiplier_(multiplier) {
}

std::chrono::milliseconds BackoffPolicy::record_failure() {
    failure_count_++;
    return calculate_delay(failure_count_);
}

void BackoffPolicy::record_success() {
    failure_count_ = 0;
}

std::chrono::milliseconds BackoffPolicy::next_delay() const {
    return calculate_delay(failure_count_);
}

std::chrono::milliseconds BackoffPolicy::calculate_delay(int failure_count) const {
    if (failure_count <= 0) {
        return std::chrono::milliseconds(0);
    }

    if (strategy_ == BackoffStrategy::Fixed) {
        return base_delay_;
    }

    double delay_ms = static_cast<double>(base_delay_.count()) *
                      std::pow(multiplier_, failure_count - 1);
    delay_ms = std::min(delay_ms, static_cast<double>(max_delay_.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}
