#include "sim_strategy.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

SimConvertibleStrategy::SimConvertibleStrategy(Address address, std::shared_ptr<InMemoryToken> asset,
                                               int64_t lockup_ms, Clock clock)
    : address_(std::move(address))
    , asset_(std::move(asset))
    , lockup_ms_(lockup_ms)
    , clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
{}

Amount SimConvertibleStrategy::convert_to_shares(Amount assets) const {
    Amount backing = total_assets();
    if (total_units_ == 0 || backing == 0) return assets;
    return util::mul_div_down(assets, total_units_, backing);
}

Amount SimConvertibleStrategy::convert_to_assets(Amount units) const {
    if (total_units_ == 0) return units;
    return util::mul_div_down(units, total_assets(), total_units_);
}

Amount SimConvertibleStrategy::balance_of(const Address& holder) const {
    auto it = units_.find(holder);
    return it == units_.end() ? 0 : it->second;
}

Amount SimConvertibleStrategy::deposit(const Address& caller, Amount assets, const Address& receiver) {
    if (assets == 0) {
        throw std::invalid_argument("deposit of zero assets");
    }
    Amount units = convert_to_shares(assets);
    if (units == 0) {
        throw std::invalid_argument("deposit too small to issue units");
    }
    if (!asset_->transfer_from(address_, caller, address_, assets)) {
        throw std::runtime_error("asset transfer into " + address_ + " failed");
    }
    
    total_units_ += units;
    units_[receiver] += units;
    if (lockup_ms_ > 0) {
        unlock_at_ms_[receiver] = clock_() + lockup_ms_;
    }
    return units;
}

Amount SimConvertibleStrategy::redeem(const Address& caller, Amount units,
                                      const Address& receiver, const Address& owner) {
    if (caller != owner) {
        throw std::runtime_error("redeem on behalf of another owner is not supported");
    }
    if (balance_of(owner) < units) {
        throw std::runtime_error("redeem exceeds units held by " + owner);
    }
    auto lock = unlock_at_ms_.find(owner);
    if (lock != unlock_at_ms_.end() && clock_() < lock->second) {
        throw std::runtime_error(address_ + " is locked for " + owner + " until " +
                                 std::to_string(lock->second));
    }
    
    Amount assets = convert_to_assets(units);
    if (!asset_->transfer(address_, receiver, assets)) {
        throw std::runtime_error("asset transfer out of " + address_ + " failed");
    }
    total_units_ -= units;
    units_[owner] -= units;
    return assets;
}

Amount SimConvertibleStrategy::simulate_yield(uint32_t bps) {
    Amount gain = util::mul_div_down(total_assets(), bps, BPS_DENOMINATOR);
    asset_->mint(address_, gain);
    spdlog::info("Simulated yield on {}: +{} assets ({} bps)", address_, gain, bps);
    return gain;
}

Amount SimConvertibleStrategy::simulate_loss(uint32_t bps) {
    if (bps > BPS_DENOMINATOR) {
        throw std::invalid_argument("loss cannot exceed 10000 bps");
    }
    Amount loss = util::mul_div_down(total_assets(), bps, BPS_DENOMINATOR);
    asset_->burn(address_, loss);
    spdlog::warn("Simulated loss on {}: -{} assets ({} bps)", address_, loss, bps);
    return loss;
}
