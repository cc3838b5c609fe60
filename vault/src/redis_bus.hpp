#pragma once

#include "events.hpp"
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    using Attrs = std::unordered_map<std::string, std::string>;
    using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
    using ItemStream = std::vector<Item>;
    
    explicit RedisBus(const std::string& redis_url);
    
    void create_consumer_group(const std::string& stream, const std::string& group);
    
    std::vector<std::pair<std::string, nlohmann::json>>
        read_commands(const std::string& stream, const std::string& group,
                      const std::string& consumer, int count = 10, int block_ms = 1000);
    
    void publish_reply(const std::string& stream, const nlohmann::json& reply);
    void publish_event(const std::string& stream, const VaultEvent& event);
    
    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);
    
    bool ping();
    
private:
    std::shared_ptr<sw::redis::Redis> redis_;
    
    void xadd_json(const std::string& stream, const nlohmann::json& data);
};
