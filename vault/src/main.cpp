#include "command_handler.hpp"
#include "config.hpp"
#include "health.hpp"
#include "postgres_store.hpp"
#include "redis_bus.hpp"
#include "sim_environment.hpp"
#include "util.hpp"
#include "vault.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void command_consumer_loop(std::shared_ptr<Config> config,
                           std::shared_ptr<RedisBus> redis,
                           std::shared_ptr<CommandHandler> handler,
                           std::atomic<bool>& running) {
    
    spdlog::info("Starting command consumer");
    redis->create_consumer_group(config->stream_req, config->service_name);
    
    while (running) {
        try {
            auto commands = redis->read_commands(config->stream_req, config->service_name,
                                                "consumer1", 10, 1000);
            
            for (const auto& [msg_id, cmd_json] : commands) {
                try {
                    auto reply = handler->handle(cmd_json);
                    redis->publish_reply(config->stream_rep, reply);
                    redis->ack_message(config->stream_req, config->service_name, msg_id);
                    
                } catch (const std::exception& e) {
                    spdlog::error("Failed to process command {}: {}", msg_id, e.what());
                }
            }
            
        } catch (const std::exception& e) {
            spdlog::error("Command consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    
    spdlog::info("Command consumer stopped");
}

void snapshot_loop(std::shared_ptr<Config> config,
                   std::shared_ptr<CommandHandler> handler,
                   std::shared_ptr<PostgresStore> pg,
                   std::atomic<bool>& running) {
    
    auto next = std::chrono::steady_clock::now();
    
    while (running) {
        if (std::chrono::steady_clock::now() >= next) {
            try {
                bool paused = false;
                auto metrics = handler->metrics(paused);
                int64_t id = pg->save_snapshot(metrics, paused);
                spdlog::debug("Saved vault snapshot {}", id);
                
            } catch (const std::exception& e) {
                spdlog::error("Snapshot failed: {}", e.what());
            }
            next += std::chrono::seconds(config->snapshot_interval_sec);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level);
        
        spdlog::info("==============================================");
        spdlog::info("Stratvault Vault Service v1.0");
        spdlog::info("==============================================");
        
        config->validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        // Initialize components
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        auto sim = std::make_shared<SimEnvironment>("USDC", config->asset_decimals);
        
        VaultParams params;
        params.address = config->vault_address;
        params.name = config->vault_name;
        params.symbol = config->vault_symbol;
        params.admin = config->admin_address;
        params.max_allocation_bps = static_cast<uint32_t>(config->max_allocation_bps);
        auto vault = std::make_shared<Vault>(params, sim->token());
        
        if (!config->manager_address.empty()) {
            vault->grant_role(config->admin_address, Role::Manager, config->manager_address);
        }
        
        // Initialize database schema. State is not restored from the journal:
        // claims left pending by an earlier run are flagged, not replayed.
        pg->init_schema();
        pg->close_previous_runs();
        
        vault->subscribe([redis, pg, config](const VaultEvent& event) {
            redis->publish_event(config->stream_events, event);
            pg->save_event(event);
        });
        
        auto handler = std::make_shared<CommandHandler>(vault, sim);
        handler->set_journal([pg](const Vault& v, const std::string& cmd, const Address& holder) {
            if (cmd.find("strategy") != std::string::npos || cmd == "update_allocation") {
                pg->save_strategies(v.list_strategies());
            }
            auto requests = v.pending_withdrawals(holder);
            if (!requests.empty()) {
                pg->save_requests(requests);
            }
        });
        
        auto health = std::make_shared<HealthCheck>(redis, pg, handler);
        
        // Start command consumer
        std::atomic<bool> consumer_running{true};
        std::thread consumer_thread(command_consumer_loop, config, redis, handler,
                                    std::ref(consumer_running));
        std::thread snapshot_thread(snapshot_loop, config, handler, pg,
                                    std::ref(consumer_running));
        
        // Start HTTP health server
        httplib::Server server;
        
        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });
        
        server.Get("/metrics", [handler](const httplib::Request&, httplib::Response& res) {
            try {
                res.set_content(handler->metrics_json().dump(), "application/json");
                res.status = 200;
            } catch (const std::exception& e) {
                nlohmann::json error = {{"ok", false}, {"error", e.what()}};
                res.set_content(error.dump(), "application/json");
                res.status = 503;
            }
        });
        
        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });
        
        spdlog::info("Vault service started");
        
        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        
        // Shutdown
        spdlog::info("Stopping services...");
        consumer_running = false;
        server.stop();
        
        if (consumer_thread.joinable()) consumer_thread.join();
        if (snapshot_thread.joinable()) snapshot_thread.join();
        if (http_thread.joinable()) http_thread.join();
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
