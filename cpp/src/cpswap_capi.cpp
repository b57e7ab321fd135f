// C API wrapper exposing the quote engine (uint256) to foreign callers
#include "cpswap_capi.h"
#include "quote_engine.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

using cpswap::uint256;

namespace {

char* alloc_cstr(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

std::string arg(const char* s, const char* name) {
    if (!s) throw cpswap::invalid_pool_config(std::string(name) + " is null");
    return std::string(s);
}

template <typename F>
int run_quote(const char* reserve_in, const char* reserve_out,
              const char* fee_numerator, const char* fee_denominator,
              const char* amount, char** out, F&& fn) {
    if (!out) return -1;
    *out = nullptr;
    try {
        cpswap::PoolState state = cpswap::parse_pool_state(
            arg(reserve_in, "reserve_in"), arg(reserve_out, "reserve_out"),
            arg(fee_numerator, "fee_numerator"), arg(fee_denominator, "fee_denominator"));
        uint256 result = fn(state, cpswap::parse_amount(arg(amount, "amount")));
        *out = alloc_cstr(result.str());
        return *out ? 0 : -1;
    } catch (const cpswap::quote_error& e) {
        *out = alloc_cstr(e.what());
        return static_cast<int>(e.code()) + 1;
    } catch (const std::exception& e) {
        *out = alloc_cstr(e.what());
        return -1;
    }
}

} // namespace

extern "C" {

int cpswap_quote_forward(const char* reserve_in, const char* reserve_out,
                         const char* fee_numerator, const char* fee_denominator,
                         const char* amount_in, char** out) {
    return run_quote(reserve_in, reserve_out, fee_numerator, fee_denominator, amount_in, out,
                     [](const cpswap::PoolState& s, const uint256& a) { return cpswap::quote_forward(s, a); });
}

int cpswap_quote_reverse(const char* reserve_in, const char* reserve_out,
                         const char* fee_numerator, const char* fee_denominator,
                         const char* amount_out, char** out) {
    return run_quote(reserve_in, reserve_out, fee_numerator, fee_denominator, amount_out, out,
                     [](const cpswap::PoolState& s, const uint256& a) { return cpswap::quote_reverse(s, a); });
}

void cpswap_free_string(char* p) {
    if (p) std::free(p);
}

} // extern "C"
