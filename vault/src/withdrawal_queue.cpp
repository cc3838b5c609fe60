#include "withdrawal_queue.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

nlohmann::json request_to_json(const WithdrawalRequest& request) {
    return {
        {"id", request.id},
        {"holder", request.holder},
        {"receiver", request.receiver},
        {"shares_burned", request.shares_burned},
        {"assets_owed", request.assets_owed},
        {"created_at_ms", request.created_at_ms},
        {"completed", request.completed},
        {"completed_at_ms", request.completed_at_ms}
    };
}

uint64_t WithdrawalQueue::enqueue(const Address& holder, const Address& receiver,
                                  Amount shares_burned, Amount assets_owed, int64_t now_ms) {
    if (holder.empty() || receiver.empty()) {
        throw ValidationError("withdrawal request needs a holder and a receiver");
    }
    if (assets_owed == 0) {
        throw ValidationError("withdrawal request for zero assets");
    }
    
    Amount new_total = util::checked_add(total_queued_assets_, assets_owed);
    
    auto& list = requests_[holder];
    WithdrawalRequest request;
    request.id = list.size();
    request.holder = holder;
    request.receiver = receiver;
    request.shares_burned = shares_burned;
    request.assets_owed = assets_owed;
    request.created_at_ms = now_ms;
    list.push_back(request);
    
    total_queued_assets_ = new_total;
    
    spdlog::info("Withdrawal queued for {}: request {} owes {} assets ({} shares burned)",
                 holder, request.id, assets_owed, shares_burned);
    return request.id;
}

const WithdrawalRequest& WithdrawalQueue::require_pending(const Address& holder,
                                                          uint64_t request_id) const {
    auto it = requests_.find(holder);
    if (it == requests_.end() || request_id >= it->second.size()) {
        throw InsufficientState("withdrawal request " + std::to_string(request_id) +
                                " not found for " + holder);
    }
    const auto& request = it->second[request_id];
    if (request.completed) {
        throw InsufficientState("withdrawal request " + std::to_string(request_id) +
                                " already completed");
    }
    return request;
}

void WithdrawalQueue::mark_completed(const Address& holder, uint64_t request_id, int64_t now_ms) {
    require_pending(holder, request_id);
    
    auto& request = requests_[holder][request_id];
    request.completed = true;
    request.completed_at_ms = now_ms;
    total_queued_assets_ -= request.assets_owed;
}

std::vector<WithdrawalRequest> WithdrawalQueue::requests_for(const Address& holder) const {
    auto it = requests_.find(holder);
    if (it == requests_.end()) return {};
    return it->second;
}

std::vector<WithdrawalRequest> WithdrawalQueue::all_pending() const {
    std::vector<WithdrawalRequest> pending;
    for (const auto& [holder, list] : requests_) {
        for (const auto& request : list) {
            if (!request.completed) pending.push_back(request);
        }
    }
    return pending;
}

size_t WithdrawalQueue::pending_count() const {
    size_t count = 0;
    for (const auto& [holder, list] : requests_) {
        for (const auto& request : list) {
            if (!request.completed) count++;
        }
    }
    return count;
}
