/* C API over the constant-product quote engine. All integers are decimal
 * strings. On success *out receives the quoted amount; on failure it receives
 * the error message. Either way the caller frees it with cpswap_free_string.
 *
 * Return value: 0 on success, otherwise cpswap error code + 1
 * (1 InvalidPoolConfig, 2 IlliquidPool, 3 InsufficientLiquidity,
 *  4 ArithmeticOverflow, 5 InvariantViolation, 6 SlippageExceeded),
 * or -1 for any other failure. */
#ifndef CPSWAP_CAPI_H
#define CPSWAP_CAPI_H

#ifdef __cplusplus
extern "C" {
#endif

int cpswap_quote_forward(const char* reserve_in, const char* reserve_out,
                         const char* fee_numerator, const char* fee_denominator,
                         const char* amount_in, char** out);

int cpswap_quote_reverse(const char* reserve_in, const char* reserve_out,
                         const char* fee_numerator, const char* fee_denominator,
                         const char* amount_out, char** out);

void cpswap_free_string(char* p);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* CPSWAP_CAPI_H */
