#include "stream_processor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(100);
constexpr int kZscoreDecimals = 18;

} // namespace

const char* to_string(ProcessorState state) {
    switch (state) {
        case ProcessorState::Starting: return "starting";
        case ProcessorState::Running: return "running";
        case ProcessorState::Reconnecting: return "reconnecting";
        case ProcessorState::Stopping: return "stopping";
        case ProcessorState::Stopped: return "stopped";
    }
    return "unknown";
}

NoDexPolicy parse_no_dex_policy(const std::string& name) {
    if (name == "empty_success") return NoDexPolicy::EmptySuccess;
    if (name == "failure") return NoDexPolicy::Failure;
    throw std::invalid_argument("Unknown no-dex policy: " + name);
}

const char* to_string(NoDexPolicy policy) {
    switch (policy) {
        case NoDexPolicy::EmptySuccess: return "empty_success";
        case NoDexPolicy::Failure: return "failure";
    }
    return "unknown";
}

StreamProcessor::StreamProcessor(MessageChannel& channel,
                                 const ReputationScorer& scorer,
                                 StatsTracker& stats,
                                 const BackoffPolicy& backoff,
                                 const ProcessorOptions& options,
                                 Clock clock)
    : channel_(channel),
      scorer_(scorer),
      stats_(stats),
      backoff_(backoff),
      options_(options),
      clock_(clock ? std::move(clock) : Clock(util::current_unix_seconds)) {
}

void StreamProcessor::run() {
    spdlog::info("Starting stream processor (no-dex policy: {}, backoff: {})",
                 to_string(options_.no_dex_policy), to_string(backoff_.strategy()));
    if (!stop_requested_) {
        set_state(ProcessorState::Running);
    }

    while (!stop_requested_) {
        try {
            auto messages = channel_.receive(options_.read_count, options_.read_block_ms);
            for (const auto& msg : messages) {
                // Unhandled entries stay pending and are redelivered later
                if (stop_requested_) break;
                handle_message(msg);
            }
        } catch (const ChannelError& e) {
            recover(e);
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error in processing loop: {}", e.what());
            interruptible_sleep(std::chrono::seconds(1));
        }
    }

    set_state(ProcessorState::Stopping);
    set_state(ProcessorState::Stopped);
    spdlog::info("Stream processor stopped");
}

void StreamProcessor::stop() {
    stop_requested_ = true;
}

void StreamProcessor::publish(const InboundMessage& msg, const ProcessingOutcome& outcome) {
    if (outcome.success) {
        channel_.publish_success(outcome.envelope);
        spdlog::info("Published success id={} wallet={}", msg.id, outcome.wallet_address);
    } else {
        channel_.publish_failure(outcome.envelope);
        spdlog::info("Published failure id={} wallet={}", msg.id, outcome.wallet_address);
    }
}

void StreamProcessor::handle_message(const InboundMessage& msg) {
    ProcessingOutcome outcome = process_message(msg);

    // Only ChannelError leaves this function; anything else the envelope
    // triggers is reported as this message's failure
    try {
        publish(msg, outcome);
    } catch (const ChannelError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Publishing envelope failed id={} wallet={} error={}",
                      msg.id, outcome.wallet_address, e.what());
        outcome = failure_outcome(outcome.wallet_address,
                                  std::string("serialization error: ") + e.what(),
                                  outcome.timestamp);
        try {
            publish(msg, outcome);
        } catch (const ChannelError&) {
            throw;
        } catch (const std::exception& e2) {
            spdlog::error("Dropping id={} without envelope: {}", msg.id, e2.what());
        }
    }

    int64_t processed_at = msg.timestamp_s >= 0 ? msg.timestamp_s : outcome.timestamp;
    if (outcome.success) {
        stats_.record_success(processed_at);
    } else {
        stats_.record_failure(processed_at);
    }

    channel_.ack(msg.id);
}

ProcessingOutcome StreamProcessor::process_message(const InboundMessage& msg) const {
    int64_t now = clock_();
    std::string wallet = "N/A";

    try {
        nlohmann::json doc = parse_payload(msg.payload);
        wallet = best_known_wallet(doc);
        spdlog::info("Received message id={} wallet={}", msg.id, wallet);

        WalletActivity activity = WalletActivity::from_json(doc);
        std::optional<ScoreResult> result = scorer_.score(activity);

        if (!result && options_.no_dex_policy == NoDexPolicy::Failure) {
            return failure_outcome(wallet, "no dex data: no '" + kDexProtocolType +
                                   "' protocol activity for wallet", now);
        }
        return success_outcome(activity, result, now);

    } catch (const SchemaValidationError& e) {
        spdlog::error("Processing failed id={} wallet={} error={}", msg.id, wallet, e.what());
        return failure_outcome(wallet, std::string("validation error: ") + e.what(), now);
    } catch (const std::exception& e) {
        spdlog::error("Processing failed id={} wallet={} error={}", msg.id, wallet, e.what());
        return failure_outcome(wallet, e.what(), now);
    }
}

ProcessingOutcome StreamProcessor::success_outcome(const WalletActivity& activity,
                                                   const std::optional<ScoreResult>& result,
                                                   int64_t now) const {
    SuccessEnvelope envelope;
    envelope.wallet_address = activity.wallet_address;
    envelope.timestamp = now;

    if (result) {
        CategoryScore category;
        category.category = kDexProtocolType;
        category.score = result->final_score;
        category.transaction_count = result->features.total_transaction_count;
        category.features = result->features;
        envelope.categories.push_back(std::move(category));
        envelope.zscore = util::format_fixed(result->final_score, kZscoreDecimals);
    } else {
        spdlog::debug("No '{}' activity for {}, publishing empty categories",
                      kDexProtocolType, activity.wallet_address);
        envelope.zscore = util::format_fixed(0.0, kZscoreDecimals);
    }

    ProcessingOutcome outcome;
    outcome.success = true;
    outcome.wallet_address = activity.wallet_address;
    outcome.timestamp = now;
    outcome.envelope = envelope.to_json();
    return outcome;
}

ProcessingOutcome StreamProcessor::failure_outcome(const std::string& wallet_address,
                                                   const std::string& error,
                                                   int64_t now) const {
    // Parser messages can quote raw input bytes that are not valid UTF-8
    FailureEnvelope envelope;
    envelope.wallet_address = util::to_valid_utf8(wallet_address);
    envelope.timestamp = now;
    envelope.error = util::to_valid_utf8(error);

    ProcessingOutcome outcome;
    outcome.success = false;
    outcome.wallet_address = envelope.wallet_address;
    outcome.timestamp = now;
    outcome.envelope = envelope.to_json();
    return outcome;
}

void StreamProcessor::recover(const ChannelError& error) {
    spdlog::error("Channel failure: {}", error.what());
    set_state(ProcessorState::Reconnecting);

    int failed_reconnects = 0;
    while (!stop_requested_) {
        auto delay = backoff_.record_failure();
        spdlog::warn("Reconnecting in {} ms (attempt {})", delay.count(),
                     backoff_.consecutive_failures());
        interruptible_sleep(delay);
        if (stop_requested_) break;

        try {
            channel_.reconnect();
            backoff_.record_success();
            if (degraded_.exchange(false)) {
                spdlog::info("Channel recovered after {} failed reconnects", failed_reconnects);
            }
            set_state(ProcessorState::Running);
            return;
        } catch (const ChannelError& e) {
            failed_reconnects++;
            spdlog::error("Reconnect failed: {}", e.what());
            if (failed_reconnects >= options_.reconnect_alert_threshold && !degraded_.exchange(true)) {
                spdlog::critical("Channel unreachable after {} reconnect attempts, still retrying",
                                 failed_reconnects);
            }
        }
    }
}

void StreamProcessor::set_state(ProcessorState state) {
    ProcessorState previous = state_.exchange(state);
    if (previous != state) {
        spdlog::info("Processor state {} -> {}", to_string(previous), to_string(state));
    }
}

void StreamProcessor::interruptible_sleep(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop_requested_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(kSleepSlice)));
    }
}
