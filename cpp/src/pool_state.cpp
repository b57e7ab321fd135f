#include "pool_state.hpp"
#include "quote_errors.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <cctype>

namespace cpswap {

PoolState::PoolState(
    const uint256& reserve_in,
    const uint256& reserve_out,
    const uint256& fee_numerator,
    const uint256& fee_denominator
)
    : reserve_in_(reserve_in),
      reserve_out_(reserve_out),
      fee_numerator_(fee_numerator),
      fee_denominator_(fee_denominator) {
    if (fee_denominator_ == 0) {
        throw invalid_pool_config("fee denominator is zero");
    }
    if (fee_numerator_ >= fee_denominator_) {
        throw invalid_pool_config(
            "fee numerator " + fee_numerator_.str() +
            " must be below fee denominator " + fee_denominator_.str());
    }
}

PoolState PoolState::reversed() const {
    return PoolState(reserve_out_, reserve_in_, fee_numerator_, fee_denominator_);
}

wide_uint PoolState::invariant_k() const {
    return ConstantProductMath::widen(reserve_in_) * ConstantProductMath::widen(reserve_out_);
}

bool PoolState::operator==(const PoolState& other) const {
    return reserve_in_ == other.reserve_in_ &&
           reserve_out_ == other.reserve_out_ &&
           fee_numerator_ == other.fee_numerator_ &&
           fee_denominator_ == other.fee_denominator_;
}

namespace {

// int256 is sign-magnitude, so every non-negative value fits in uint256.
uint256 non_negative(const int256& v, const char* field) {
    if (v < 0) {
        throw invalid_pool_config(std::string(field) + " is negative: " + v.str());
    }
    return uint256(v);
}

} // namespace

PoolState make_pool_state(
    const int256& reserve_in,
    const int256& reserve_out,
    const int256& fee_numerator,
    const int256& fee_denominator
) {
    return PoolState(
        non_negative(reserve_in, "reserve_in"),
        non_negative(reserve_out, "reserve_out"),
        non_negative(fee_numerator, "fee_numerator"),
        non_negative(fee_denominator, "fee_denominator"));
}

PoolState parse_pool_state(
    const std::string& reserve_in,
    const std::string& reserve_out,
    const std::string& fee_numerator,
    const std::string& fee_denominator
) {
    return PoolState(
        parse_amount(reserve_in),
        parse_amount(reserve_out),
        parse_amount(fee_numerator),
        parse_amount(fee_denominator));
}

uint256 parse_amount(const std::string& s) {
    if (s.empty()) {
        throw invalid_pool_config("empty amount");
    }
    if (s[0] == '-') {
        throw invalid_pool_config("negative amount: " + s);
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw invalid_pool_config("not a decimal integer: " + s);
        }
    }
    // boost reads a leading 0 as octal
    const std::string::size_type first = s.find_first_not_of('0');
    if (first == std::string::npos) {
        return 0;
    }
    // Parse unbounded first: the fixed-width type would wrap silently.
    const boost::multiprecision::cpp_int v(s.substr(first));
    if (v > boost::multiprecision::cpp_int(ConstantProductMath::max_uint256())) {
        throw invalid_pool_config("amount exceeds 256 bits: " + s);
    }
    return uint256(v);
}

} // namespace cpswap
