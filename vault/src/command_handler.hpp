#pragma once

#include "sim_environment.hpp"
#include "vault.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Maps JSON commands {cmd, corr_id, from:{address}, args} onto the vault
// and builds the reply. Calls are serialised; the vault itself is not
// thread-safe.
class CommandHandler {
public:
    // Invoked under the lock after a state-changing command succeeded,
    // with the holder whose requests may have changed.
    using Journal = std::function<void(const Vault&, const std::string& cmd, const Address& holder)>;
    
    CommandHandler(std::shared_ptr<Vault> vault, std::shared_ptr<SimEnvironment> sim);
    
    nlohmann::json handle(const nlohmann::json& cmd);
    
    nlohmann::json metrics_json();
    VaultMetrics metrics(bool& paused);
    // {"state": "up" | "insolvent" | "unavailable", ...}
    nlohmann::json valuation_status();
    bool valuation_available();
    
    void set_journal(Journal journal) { journal_ = std::move(journal); }
    
private:
    std::shared_ptr<Vault> vault_;
    std::shared_ptr<SimEnvironment> sim_;
    Journal journal_;
    std::mutex mutex_;
    
    // Returns reply data; sets `message` and the affected holder.
    nlohmann::json dispatch(const std::string& cmd, const Address& caller,
                            const nlohmann::json& args, std::string& message,
                            Address& holder, bool& mutated);
};
