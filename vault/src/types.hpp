#pragma once

#include <string>
#include <cstdint>

// Account handle on the asset ledger (holders, strategies, the vault itself).
using Address = std::string;

// Asset or share amount in the smallest unit.
using Amount = uint64_t;

constexpr uint32_t BPS_DENOMINATOR = 10000;
