#include "quote_engine.hpp"

namespace cpswap {

uint256 quote_forward(const PoolState& state, const uint256& amount_in) {
    return ConstantProductMath::get_amount_out(
        amount_in,
        state.reserve_in(),
        state.reserve_out(),
        state.fee_numerator(),
        state.fee_denominator());
}

uint256 quote_reverse(const PoolState& state, const uint256& amount_out) {
    return ConstantProductMath::get_amount_in(
        amount_out,
        state.reserve_in(),
        state.reserve_out(),
        state.fee_numerator(),
        state.fee_denominator());
}

uint256 quote(const PoolState& state, const TradeRequest& request) {
    if (request.direction == trade_direction::exact_in) {
        return quote_forward(state, request.amount);
    }
    return quote_reverse(state, request.amount);
}

PoolState commit(const PoolState& state, const uint256& amount_in, const uint256& amount_out) {
    if (!state.is_liquid()) {
        throw invariant_violation("commit against an illiquid pool");
    }

    uint256 producible;
    try {
        producible = quote_forward(state, amount_in);
    } catch (const arithmetic_overflow& e) {
        throw invariant_violation(std::string("commit: trade not quotable: ") + e.what());
    }
    if (amount_out > producible) {
        throw invariant_violation(
            "commit: amount_out " + amount_out.str() +
            " exceeds " + producible.str() + " producible from amount_in " + amount_in.str());
    }

    const wide_uint new_reserve_in =
        ConstantProductMath::widen(state.reserve_in()) + ConstantProductMath::widen(amount_in);
    if (new_reserve_in > ConstantProductMath::widen(ConstantProductMath::max_uint256())) {
        throw invariant_violation("commit: input reserve would exceed 256 bits");
    }

    PoolState next(
        uint256(new_reserve_in),
        state.reserve_out() - amount_out,
        state.fee_numerator(),
        state.fee_denominator());

    // Follows from amount_out <= producible; checked so a broken chain is caught here.
    if (next.invariant_k() < state.invariant_k()) {
        throw invariant_violation("commit: constant product decreased");
    }
    return next;
}

SwapResult swap_exact_in(
    const PoolState& state,
    const uint256& amount_in,
    const uint256& min_amount_out
) {
    const uint256 amount_out = quote_forward(state, amount_in);
    if (amount_out < min_amount_out) {
        throw slippage_exceeded(
            "slippage: out " + amount_out.str() + " < min " + min_amount_out.str());
    }
    return SwapResult{amount_in, amount_out, commit(state, amount_in, amount_out)};
}

SwapResult swap_exact_out(
    const PoolState& state,
    const uint256& amount_out,
    const uint256& max_amount_in
) {
    const uint256 amount_in = quote_reverse(state, amount_out);
    if (amount_in > max_amount_in) {
        throw slippage_exceeded(
            "slippage: in " + amount_in.str() + " > max " + max_amount_in.str());
    }
    return SwapResult{amount_in, amount_out, commit(state, amount_in, amount_out)};
}

} // namespace cpswap
