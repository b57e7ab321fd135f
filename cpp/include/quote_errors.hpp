// Error taxonomy of the quote engine. Every failure is a quote_error carrying
// a code so outer layers (harness, C API) can report it without string matching.
#pragma once

#include <stdexcept>
#include <string>

namespace cpswap {

enum class error_code {
    InvalidPoolConfig,
    IlliquidPool,
    InsufficientLiquidity,
    ArithmeticOverflow,
    InvariantViolation,
    SlippageExceeded
};

inline const char* to_string(error_code code) {
    switch (code) {
        case error_code::InvalidPoolConfig:     return "InvalidPoolConfig";
        case error_code::IlliquidPool:          return "IlliquidPool";
        case error_code::InsufficientLiquidity: return "InsufficientLiquidity";
        case error_code::ArithmeticOverflow:    return "ArithmeticOverflow";
        case error_code::InvariantViolation:    return "InvariantViolation";
        case error_code::SlippageExceeded:      return "SlippageExceeded";
    }
    return "Unknown";
}

class quote_error : public std::runtime_error {
public:
    quote_error(error_code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    error_code code() const noexcept { return code_; }

private:
    error_code code_;
};

struct invalid_pool_config : quote_error {
    explicit invalid_pool_config(const std::string& what)
        : quote_error(error_code::InvalidPoolConfig, what) {}
};

struct illiquid_pool : quote_error {
    explicit illiquid_pool(const std::string& what)
        : quote_error(error_code::IlliquidPool, what) {}
};

struct insufficient_liquidity : quote_error {
    explicit insufficient_liquidity(const std::string& what)
        : quote_error(error_code::InsufficientLiquidity, what) {}
};

struct arithmetic_overflow : quote_error {
    explicit arithmetic_overflow(const std::string& what)
        : quote_error(error_code::ArithmeticOverflow, what) {}
};

struct invariant_violation : quote_error {
    explicit invariant_violation(const std::string& what)
        : quote_error(error_code::InvariantViolation, what) {}
};

struct slippage_exceeded : quote_error {
    explicit slippage_exceeded(const std::string& what)
        : quote_error(error_code::SlippageExceeded, what) {}
};

} // namespace cpswap
