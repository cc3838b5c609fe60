#include "health.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<CommandHandler> handler)
    : redis_(redis), pg_(pg), handler_(handler) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();
    nlohmann::json valuation = handler_->valuation_status();
    bool valuation_ok = valuation["state"] == "up";
    
    nlohmann::json status = {
        {"ok", redis_ok && pg_ok && valuation_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"valuation", valuation["state"]}
    };
    // An insolvent vault still serves exits; report how far claims are uncovered.
    if (valuation.contains("shortfall")) {
        status["shortfall"] = valuation["shortfall"];
        status["total_queued"] = valuation["total_queued"];
    }
    if (valuation.contains("error")) {
        status["valuation_error"] = valuation["error"];
    }
    
    return status;
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && pg_->ping() && handler_->valuation_available();
}
