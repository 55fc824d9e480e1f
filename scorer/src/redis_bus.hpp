#pragma once

#include "message_channel.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <sw/redis++/redis++.h>

struct StreamNames {
    std::string input;
    std::string success;
    std::string failure;
    std::string group;
    std::string consumer;
};

// MessageChannel over Redis Streams. Each entry carries the JSON document in
// field "data". Input is read through a consumer group; after connecting the
// consumer drains its own pending entries before reading new ones.
class RedisBus : public MessageChannel {
public:
    RedisBus(const std::string& redis_url, const StreamNames& streams);
    ~RedisBus() override;

    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

    std::vector<InboundMessage> receive(int count, int block_ms) override;
    void publish_success(const nlohmann::json& envelope) override;
    void publish_failure(const nlohmann::json& envelope) override;
    void ack(const std::string& msg_id) override;
    void reconnect() override;
    bool ping() override;

private:
    using Attrs = std::unordered_map<std::string, std::string>;
    using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
    using ItemStream = std::vector<Item>;

    void connect();
    void create_consumer_group();
    void publish(const std::string& stream, const nlohmann::json& data);
    std::shared_ptr<sw::redis::Redis> client();

    std::string redis_url_;
    StreamNames streams_;

    // ping() is called from the status API thread
    std::mutex client_mutex_;
    std::shared_ptr<sw::redis::Redis> redis_;

    bool draining_pending_ = true;
};
