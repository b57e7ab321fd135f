#include "constant_product_math.hpp"
#include "quote_errors.hpp"

#include <limits>
#include <stdexcept>

namespace cpswap {

namespace {

void check_fee(const uint256& fee_numerator, const uint256& fee_denominator) {
    if (fee_denominator == 0) {
        throw invalid_pool_config("fee denominator is zero");
    }
    if (fee_numerator >= fee_denominator) {
        throw invalid_pool_config("fee numerator must be below fee denominator");
    }
}

} // namespace

const uint256& ConstantProductMath::max_uint256() {
    static const uint256 v = std::numeric_limits<uint256>::max();
    return v;
}

uint256 ConstantProductMath::narrow(const wide_uint& x) {
    if (x > widen(max_uint256())) {
        throw arithmetic_overflow("result exceeds 256 bits: " + x.str());
    }
    return uint256(x);
}

uint256 ConstantProductMath::get_amount_out(
    const uint256& amount_in,
    const uint256& reserve_in,
    const uint256& reserve_out,
    const uint256& fee_numerator,
    const uint256& fee_denominator
) {
    check_fee(fee_numerator, fee_denominator);
    if (reserve_in == 0 || reserve_out == 0) {
        throw illiquid_pool("cannot quote against an empty reserve");
    }
    if (amount_in == 0) {
        return 0;
    }

    const uint256 fee_multiplier = fee_denominator - fee_numerator;

    wide_uint numerator;
    wide_uint denominator;
    try {
        // amount_in * m always fits; the product with reserve_out may not
        const wide_uint amount_in_net = widen(amount_in) * widen(fee_multiplier);
        numerator = amount_in_net * widen(reserve_out);
        denominator = widen(reserve_in) * widen(fee_denominator) + amount_in_net;
    } catch (const std::overflow_error& e) {
        throw arithmetic_overflow(std::string("get_amount_out: ") + e.what());
    }

    return narrow(numerator / denominator);
}

uint256 ConstantProductMath::get_amount_in(
    const uint256& amount_out,
    const uint256& reserve_in,
    const uint256& reserve_out,
    const uint256& fee_numerator,
    const uint256& fee_denominator
) {
    check_fee(fee_numerator, fee_denominator);
    if (reserve_in == 0 || reserve_out == 0) {
        throw illiquid_pool("cannot quote against an empty reserve");
    }
    if (amount_out >= reserve_out) {
        throw insufficient_liquidity(
            "requested " + amount_out.str() + " of reserve " + reserve_out.str());
    }
    if (amount_out == 0) {
        return 0;
    }

    const uint256 fee_multiplier = fee_denominator - fee_numerator;

    wide_uint quotient;
    try {
        const wide_uint numerator =
            widen(reserve_in) * widen(amount_out) * widen(fee_denominator);
        const wide_uint denominator =
            widen(reserve_out - amount_out) * widen(fee_multiplier);
        // +1 after division so the trader never pays less than the exact inverse
        quotient = numerator / denominator + 1;
    } catch (const std::overflow_error& e) {
        throw arithmetic_overflow(std::string("get_amount_in: ") + e.what());
    }

    return narrow(quotient);
}

} // namespace cpswap
