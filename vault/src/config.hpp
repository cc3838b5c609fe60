#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;
    std::string stream_events;
    
    // Postgres
    std::string pg_dsn;
    
    // Vault
    std::string vault_address;
    std::string vault_name;
    std::string vault_symbol;
    std::string admin_address;
    std::string manager_address;
    int max_allocation_bps;
    int asset_decimals;
    int snapshot_interval_sec;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
