#pragma once

#include "events.hpp"
#include "vault.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>

// Write-side journal of the vault: strategy list, withdrawal requests,
// metrics snapshots and emitted events. Nothing is read back; every process
// starts a fresh in-memory vault and journals under its own run id, so rows
// from earlier runs never collide with the current one.
class PostgresStore {
public:
    explicit PostgresStore(const std::string& dsn);
    
    void init_schema();
    // Marks what earlier runs left open (pending requests, active strategies)
    // as superseded. Returns the number of withdrawal requests affected.
    int close_previous_runs();
    
    int64_t run_id() const { return run_id_; }
    
    void save_strategies(const std::vector<Strategy>& strategies);
    void save_requests(const std::vector<WithdrawalRequest>& requests);
    int64_t save_snapshot(const VaultMetrics& metrics, bool paused);
    void save_event(const VaultEvent& event);
    
    bool ping();
    
private:
    std::string dsn_;
    int64_t run_id_;
    
    pqxx::connection make_connection();
};
