#ifndef POOL_STATE_HPP
#define POOL_STATE_HPP

#include <string>
#include "constant_product_math.hpp"

namespace cpswap {

// Immutable snapshot of a two-token pool, oriented in one trade direction:
// reserve_in is the token the trader sends, reserve_out the one received.
// Fee is fee_numerator / fee_denominator of the input, kept by the pool.
class PoolState {
public:
    // Throws invalid_pool_config unless 0 <= fee_numerator < fee_denominator.
    // Zero reserves are accepted here; quoting against them is rejected.
    PoolState(
        const uint256& reserve_in,
        const uint256& reserve_out,
        const uint256& fee_numerator,
        const uint256& fee_denominator
    );

    const uint256& reserve_in() const { return reserve_in_; }
    const uint256& reserve_out() const { return reserve_out_; }
    const uint256& fee_numerator() const { return fee_numerator_; }
    const uint256& fee_denominator() const { return fee_denominator_; }

    uint256 fee_multiplier() const { return fee_denominator_ - fee_numerator_; }

    bool is_liquid() const { return reserve_in_ > 0 && reserve_out_ > 0; }

    // Same pool, opposite trade direction.
    PoolState reversed() const;

    // reserve_in * reserve_out, exact.
    wide_uint invariant_k() const;

    bool operator==(const PoolState& other) const;
    bool operator!=(const PoolState& other) const { return !(*this == other); }

private:
    uint256 reserve_in_;
    uint256 reserve_out_;
    uint256 fee_numerator_;
    uint256 fee_denominator_;
};

// Signed entry point for callers holding raw ledger figures.
// Negative values are rejected with invalid_pool_config.
PoolState make_pool_state(
    const int256& reserve_in,
    const int256& reserve_out,
    const int256& fee_numerator,
    const int256& fee_denominator
);

// Decimal string entry point (harness, C API).
PoolState parse_pool_state(
    const std::string& reserve_in,
    const std::string& reserve_out,
    const std::string& fee_numerator,
    const std::string& fee_denominator
);

// Parses a non-negative decimal integer below 2^256.
// Throws invalid_pool_config for empty, negative, non-decimal or oversized input.
uint256 parse_amount(const std::string& s);

} // namespace cpswap

#endif // POOL_STATE_HPP
