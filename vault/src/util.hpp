#pragma once

#include <string>
#include <cstdint>
#include <chrono>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::string redact_dsn(const std::string& dsn);

    // a * b / denominator through a 128-bit intermediate.
    // Throws std::invalid_argument on a zero denominator and
    // std::overflow_error when the result does not fit in 64 bits.
    uint64_t mul_div_down(uint64_t a, uint64_t b, uint64_t denominator);
    uint64_t mul_div_up(uint64_t a, uint64_t b, uint64_t denominator);

    uint64_t checked_add(uint64_t a, uint64_t b);
    uint64_t pow10(int exponent);
}
