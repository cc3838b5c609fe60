#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <iterator>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group may already exist: {}", e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_commands(const std::string& stream, const std::string& group,
                        const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;
    std::unordered_map<std::string, ItemStream> items;
    
    redis_->xreadgroup(group, consumer, stream, ">",
                       std::chrono::milliseconds(block_ms), count,
                       std::inserter(items, items.end()));
    
    for (const auto& [stream_name, item_stream] : items) {
        for (const auto& item : item_stream) {
            if (!item.second) {
                spdlog::warn("Message {} on {} has no fields", item.first, stream_name);
                results.emplace_back(item.first, nlohmann::json::object());
                continue;
            }
            auto it = item.second->find("data");
            if (it == item.second->end()) {
                spdlog::warn("Message {} on {} has no data field", item.first, stream_name);
                results.emplace_back(item.first, nlohmann::json::object());
                continue;
            }
            try {
                results.emplace_back(item.first, nlohmann::json::parse(it->second));
            } catch (const nlohmann::json::parse_error& e) {
                spdlog::error("Failed to parse command {}: {}", item.first, e.what());
                results.emplace_back(item.first, nlohmann::json::object());
            }
        }
    }
    
    return results;
}

void RedisBus::xadd_json(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();
    redis_->xadd(stream, "*", fields.begin(), fields.end());
}

void RedisBus::publish_reply(const std::string& stream, const nlohmann::json& reply) {
    try {
        xadd_json(stream, reply);
        spdlog::debug("Published reply to {}", stream);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish reply: {}", e.what());
        throw;
    }
}

void RedisBus::publish_event(const std::string& stream, const VaultEvent& event) {
    try {
        xadd_json(stream, event.to_json());
        spdlog::debug("Published {} event", event.name);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish {} event: {}", event.name, e.what());
    }
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message {}: {}", msg_id, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
