#ifndef LMSR_CAPI_H
#define LMSR_CAPI_H

/*
 * C ABI over the LMSR core. Numbers travel as base-10 strings; every
 * returned string must be released with lmsr_free_string, every returned
 * array with lmsr_free_string_array. On failure the functions return NULL
 * and lmsr_last_error() holds the lmsr::errc value (-1 for malformed input).
 */

#ifdef __cplusplus
extern "C" {
#endif

int lmsr_last_error(void);

char* lmsr_fp_exp(const char* x);
char* lmsr_fp_ln(const char* x);

char* lmsr_cost(const char* scale, const char* const* supplies, int n);
char* lmsr_price(const char* scale, const char* const* supplies, int n, int index);

/* Returns 3 strings: shares minted, new supply, new reserve of the outcome. */
char** lmsr_buy_shares(const char* scale, const char* const* supplies, const char* const* reserves,
                       int n, int index, const char* amount_in);

void lmsr_free_string(char* p);
void lmsr_free_string_array(char** arr, int n);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* LMSR_CAPI_H */
