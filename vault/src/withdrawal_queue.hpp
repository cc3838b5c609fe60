#pragma once

#include "types.hpp"
#include <map>
#include <vector>
#include <nlohmann/json.hpp>

struct WithdrawalRequest {
    uint64_t id = 0;          // index in the holder's list
    Address holder;           // owner whose shares were burned
    Address receiver;         // who gets paid on completion
    Amount shares_burned = 0;
    Amount assets_owed = 0;
    int64_t created_at_ms = 0;
    bool completed = false;
    int64_t completed_at_ms = 0;
};

nlohmann::json request_to_json(const WithdrawalRequest& request);

// Deferred withdrawals. Per-holder lists are append-only; a request moves
// from pending to completed exactly once and is never removed.
class WithdrawalQueue {
public:
    uint64_t enqueue(const Address& holder, const Address& receiver,
                     Amount shares_burned, Amount assets_owed, int64_t now_ms);
    
    // Throws InsufficientState if the request does not exist or is completed.
    const WithdrawalRequest& require_pending(const Address& holder, uint64_t request_id) const;
    void mark_completed(const Address& holder, uint64_t request_id, int64_t now_ms);
    
    std::vector<WithdrawalRequest> requests_for(const Address& holder) const;
    std::vector<WithdrawalRequest> all_pending() const;
    
    Amount total_queued_assets() const { return total_queued_assets_; }
    size_t pending_count() const;
    
private:
    std::map<Address, std::vector<WithdrawalRequest>> requests_;
    Amount total_queued_assets_ = 0;
};
