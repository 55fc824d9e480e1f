#pragma once

#include "backoff.hpp"
#include "message_channel.hpp"
#include "scoring.hpp"
#include "stats.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

enum class ProcessorState {
    Starting,
    Running,
    Reconnecting,
    Stopping,
    Stopped
};

const char* to_string(ProcessorState state);

// What to emit for a wallet with no "dexes" block
enum class NoDexPolicy {
    EmptySuccess,  // success envelope with an empty categories list
    Failure        // failure envelope with a "no dex data" error
};

NoDexPolicy parse_no_dex_policy(const std::string& name);
const char* to_string(NoDexPolicy policy);

struct ProcessorOptions {
    int read_count = 10;
    int read_block_ms = 1000;
    NoDexPolicy no_dex_policy = NoDexPolicy::EmptySuccess;
    int reconnect_alert_threshold = 5;
};

struct ProcessingOutcome {
    bool success = false;
    std::string wallet_address;
    int64_t timestamp = 0;  // emission time
    nlohmann::json envelope;
};

// Consume -> validate -> score -> publish loop. Messages are handled one at
// a time in delivery order and acknowledged only after their envelope has
// been published.
class StreamProcessor {
public:
    using Clock = std::function<int64_t()>;

    StreamProcessor(MessageChannel& channel,
                    const ReputationScorer& scorer,
                    StatsTracker& stats,
                    const BackoffPolicy& backoff,
                    const ProcessorOptions& options,
                    Clock clock = nullptr);

    // Blocks until stop() is observed
    void run();

    // Stops pulling new messages; the message in flight is finished first.
    // Only sets an atomic flag, so it is safe from a signal handler.
    void stop();

    ProcessorState state() const { return state_.load(); }
    bool degraded() const { return degraded_.load(); }

    // Decode and score one message into its envelope. Never throws for
    // message content.
    ProcessingOutcome process_message(const InboundMessage& msg) const;

private:
    void handle_message(const InboundMessage& msg);
    void publish(const InboundMessage& msg, const ProcessingOutcome& outcome);
    void recover(const ChannelError& error);
    void set_state(ProcessorState state);
    void interruptible_sleep(std::chrono::milliseconds duration) const;

    ProcessingOutcome success_outcome(const WalletActivity& activity,
                                      const std::optional<ScoreResult>& result,
                                      int64_t now) const;
    ProcessingOutcome failure_outcome(const std::string& wallet_address,
                                      const std::string& error,
                                      int64_t now) const;

    MessageChannel& channel_;
    const ReputationScorer& scorer_;
    StatsTracker& stats_;
    BackoffPolicy backoff_;
    ProcessorOptions options_;
    Clock clock_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<ProcessorState> state_{ProcessorState::Starting};
    std::atomic<bool> degraded_{false};
};
