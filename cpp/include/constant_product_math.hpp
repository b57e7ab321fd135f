#ifndef CONSTANT_PRODUCT_MATH_HPP
#define CONSTANT_PRODUCT_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <string>

namespace cpswap {

using uint256 = boost::multiprecision::uint256_t;
using int256 = boost::multiprecision::int256_t;

// Holds any product of two uint256 values. Overflow throws instead of wrapping.
using wide_uint = boost::multiprecision::checked_uint512_t;

// Raw x*y=k formulae over explicit reserves and a rational fee taken from the
// input side. All intermediates are evaluated in wide_uint.
class ConstantProductMath {
public:
    // floor(dx*m*y / (x*D + dx*m)), m = D - fee_numerator
    static uint256 get_amount_out(
        const uint256& amount_in,
        const uint256& reserve_in,
        const uint256& reserve_out,
        const uint256& fee_numerator,
        const uint256& fee_denominator
    );

    // floor(x*dy*D / ((y - dy)*m)) + 1, rounded against the trader
    static uint256 get_amount_in(
        const uint256& amount_out,
        const uint256& reserve_in,
        const uint256& reserve_out,
        const uint256& fee_numerator,
        const uint256& fee_denominator
    );

    static wide_uint widen(const uint256& x) { return wide_uint(x); }

    // Throws arithmetic_overflow when x does not fit in 256 bits.
    static uint256 narrow(const wide_uint& x);

    static const uint256& max_uint256();
};

} // namespace cpswap

#endif // CONSTANT_PRODUCT_MATH_HPP
