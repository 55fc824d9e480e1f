#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Transport-level failure: broker unreachable, read/publish/ack rejected
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& what)
        : std::runtime_error(what) {}
};

struct InboundMessage {
    std::string id;
    std::string payload;      // raw JSON text, may be malformed
    int64_t timestamp_s = -1; // broker enqueue time, -1 if unknown
};

// Input stream plus success/failure output streams. All operations throw
// ChannelError on transport failure.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    virtual std::vector<InboundMessage> receive(int count, int block_ms) = 0;
    virtual void publish_success(const nlohmann::json& envelope) = 0;
    virtual void publish_failure(const nlohmann::json& envelope) = 0;
    virtual void ack(const std::string& msg_id) = 0;

    // Drop the current connection, connect again and resubscribe
    virtual void reconnect() = 0;

    virtual bool ping() = 0;
};
