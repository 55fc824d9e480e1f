#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

RedisBus::RedisBus(const std::string& redis_url, const StreamNames& streams)
    : redis_url_(redis_url), streams_(streams) {
    try {
        connect();
    } catch (const ChannelError& e) {
        // First receive() fails and the processor reconnects with backoff
        spdlog::error("{}", e.what());
    }
}

RedisBus::~RedisBus() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    redis_.reset();
    spdlog::info("Closed Redis connection");
}

void RedisBus::connect() {
    try {
        auto redis = std::make_shared<sw::redis::Redis>(redis_url_);
        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            redis_ = redis;
        }
        create_consumer_group();
        draining_pending_ = true;
        spdlog::info("Connected to Redis: {}", redis_url_);
    } catch (const sw::redis::Error& e) {
        throw ChannelError(std::string("Failed to connect to Redis: ") + e.what());
    }
}

void RedisBus::create_consumer_group() {
    try {
        client()->xgroup_create(streams_.input, streams_.group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", streams_.group, streams_.input);
    } catch (const sw::redis::ReplyError& e) {
        // BUSYGROUP: group already exists
        spdlog::debug("Consumer group may already exist: {}", e.what());
    }
}

std::shared_ptr<sw::redis::Redis> RedisBus::client() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (!redis_) {
        throw ChannelError("Redis client is not connected");
    }
    return redis_;
}

std::vector<InboundMessage> RedisBus::receive(int count, int block_ms) {
    std::vector<InboundMessage> results;
    std::unordered_map<std::string, ItemStream> items;

    try {
        auto redis = client();
        if (draining_pending_) {
            redis->xreadgroup(streams_.group, streams_.consumer,
                streams_.input, "0",
                count,
                std::inserter(items, items.end()));
        } else {
            redis->xreadgroup(streams_.group, streams_.consumer,
                streams_.input, ">",
                count,
                std::chrono::milliseconds(block_ms),
                std::inserter(items, items.end()));
        }
    } catch (const sw::redis::Error& e) {
        throw ChannelError(std::string("Failed to read from ") + streams_.input + ": " + e.what());
    }

    size_t seen = 0;
    for (const auto& [stream_name, item_stream] : items) {
        for (const auto& item : item_stream) {
            ++seen;
            InboundMessage msg;
            msg.id = item.first;
            int64_t ms = util::stream_id_ms(item.first);
            msg.timestamp_s = ms >= 0 ? ms / 1000 : -1;

            // Pending entries trimmed from the stream come back without fields
            if (item.second) {
                auto it = item.second->find("data");
                if (it != item.second->end()) {
                    msg.payload = it->second;
                }
            }
            results.push_back(std::move(msg));
        }
    }

    if (draining_pending_ && seen == 0) {
        draining_pending_ = false;
    } else if (draining_pending_) {
        spdlog::info("Redelivering {} pending messages from {}", seen, streams_.input);
    }

    return results;
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        client()->xadd(stream, "*", fields.begin(), fields.end());
    } catch (const sw::redis::Error& e) {
        throw ChannelError(std::string("Failed to publish to ") + stream + ": " + e.what());
    }
}

void RedisBus::publish_success(const nlohmann::json& envelope) {
    publish(streams_.success, envelope);
}

void RedisBus::publish_failure(const nlohmann::json& envelope) {
    publish(streams_.failure, envelope);
}

void RedisBus::ack(const std::string& msg_id) {
    try {
        client()->xack(streams_.input, streams_.group, msg_id);
    } catch (const sw::redis::Error& e) {
        throw ChannelError(std::string("Failed to ack ") + msg_id + ": " + e.what());
    }
}

void RedisBus::reconnect() {
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        redis_.reset();
    }
    connect();
}

bool RedisBus::ping() {
    std::shared_ptr<sw::redis::Redis> redis;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        redis = redis_;
    }
    if (!redis) return false;

    try {
        redis->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
