#pragma once

#include "constant_product_math.hpp"
#include "pool_state.hpp"
#include "quote_errors.hpp"

namespace cpswap {

enum class trade_direction {
    exact_in,   // amount is what the trader sends
    exact_out   // amount is what the trader wants to receive
};

struct TradeRequest {
    trade_direction direction;
    uint256 amount;
};

struct SwapResult {
    uint256 amount_in;
    uint256 amount_out;
    PoolState next_state;
};

// Amount received for sending amount_in. Read-only.
// Throws illiquid_pool, arithmetic_overflow.
uint256 quote_forward(const PoolState& state, const uint256& amount_in);

// Smallest-safe amount to send to receive at least amount_out. Read-only.
// Throws illiquid_pool, insufficient_liquidity, arithmetic_overflow.
uint256 quote_reverse(const PoolState& state, const uint256& amount_out);

// Dispatches on direction: exact_in -> quote_forward, exact_out -> quote_reverse.
uint256 quote(const PoolState& state, const TradeRequest& request);

// Applies a completed trade and returns the next state; state itself is untouched.
// Throws invariant_violation unless amount_out <= quote_forward(state, amount_in)
// and the resulting reserves are representable.
PoolState commit(const PoolState& state, const uint256& amount_in, const uint256& amount_out);

// quote_forward + commit. Throws slippage_exceeded below min_amount_out.
SwapResult swap_exact_in(
    const PoolState& state,
    const uint256& amount_in,
    const uint256& min_amount_out = uint256(0)
);

// quote_reverse + commit. Throws slippage_exceeded above max_amount_in.
SwapResult swap_exact_out(
    const PoolState& state,
    const uint256& amount_out,
    const uint256& max_amount_in = ConstantProductMath::max_uint256()
);

} // namespace cpswap
