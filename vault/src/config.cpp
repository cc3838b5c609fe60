#include "config.hpp"
#include "types.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_req = get_env("STREAM_REQ", "vault.cmd.requests");
    cfg.stream_rep = get_env("STREAM_REP", "vault.cmd.replies");
    cfg.stream_events = get_env("STREAM_EVENTS", "vault.events");
    
    cfg.pg_dsn = get_env("PG_DSN");
    
    cfg.vault_address = get_env("VAULT_ADDRESS", "vault");
    cfg.vault_name = get_env("VAULT_NAME", "Multi Strategy Vault");
    cfg.vault_symbol = get_env("VAULT_SYMBOL", "MSV");
    cfg.admin_address = get_env("ADMIN_ADDRESS");
    cfg.manager_address = get_env("MANAGER_ADDRESS");
    cfg.max_allocation_bps = get_env_int("MAX_ALLOCATION_BPS", 6000);
    cfg.asset_decimals = get_env_int("ASSET_DECIMALS", 6);
    cfg.snapshot_interval_sec = get_env_int("SNAPSHOT_INTERVAL_SEC", 60);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "vault");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (admin_address.empty()) {
        throw std::runtime_error("ADMIN_ADDRESS is required");
    }
    if (vault_address.empty()) {
        throw std::runtime_error("VAULT_ADDRESS must not be empty");
    }
    if (max_allocation_bps < 0 || max_allocation_bps > static_cast<int>(BPS_DENOMINATOR)) {
        throw std::runtime_error("MAX_ALLOCATION_BPS must be within 0..10000");
    }
    if (asset_decimals < 0 || asset_decimals > 18) {
        throw std::runtime_error("ASSET_DECIMALS must be within 0..18");
    }
    if (snapshot_interval_sec <= 0) {
        throw std::runtime_error("SNAPSHOT_INTERVAL_SEC must be positive");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Vault: {} ({}) at {}", vault_name, vault_symbol, vault_address);
    spdlog::info("  Per-strategy cap: {} bps", max_allocation_bps);
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
}
