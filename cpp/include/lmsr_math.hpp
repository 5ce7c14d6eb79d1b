#ifndef LMSR_MATH_HPP
#define LMSR_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>

#include "lmsr_errors.hpp"

namespace lmsr {

using uint128 = boost::multiprecision::uint128_t;
using int128 = boost::multiprecision::int128_t;
using uint256 = boost::multiprecision::uint256_t;
using int256 = boost::multiprecision::int256_t;

// D9 fixed point: integer value = real value * 1e9
constexpr int64_t D9 = 1000000000;
constexpr int128 D9_I128 = 1000000000;
constexpr uint128 D9_U128 = 1000000000;
constexpr int128 D18_I128 = 1000000000000000000;

// Euler's number in D9
constexpr int128 E_SCALED = 2718281828;

// fp_exp saturates at or above +20 and flushes to zero at or below -20
constexpr int128 EXP_MAX_INPUT = 20000000000;
constexpr int128 EXP_MIN_INPUT = -20000000000;

constexpr int SERIES_MAX_TERMS = 20;
constexpr int LN_MAX_REDUCTIONS = 128;

class LmsrMath {
public:
    // e^(x / 1e9) scaled by 1e9. Truncated Taylor series, exits once a term
    // drops below one ULP.
    static uint128 fp_exp(const int128& x);

    // ln(x / 1e9) scaled by 1e9. Range-reduced into [1, 2) before the
    // series; throws math_domain for x == 0.
    static int128 fp_ln(const uint128& x);

    // Checked arithmetic. Signed results must fit [-2^127, 2^127 - 1],
    // unsigned results [0, 2^128 - 1]; anything else throws math_overflow.
    static int128 checked_add(const int128& a, const int128& b);
    static int128 checked_mul(const int128& a, const int128& b);
    static uint128 checked_add(const uint128& a, const uint128& b);
    static uint128 checked_sub(const uint128& a, const uint128& b);
    static uint128 checked_mul(const uint128& a, const uint128& b);
    static uint128 checked_div(const uint128& a, const uint128& b);
    static uint64_t checked_add(uint64_t a, uint64_t b);

    // Narrowing to the u64 amount domain; negative or oversized values throw.
    static uint64_t to_u64(const int128& v);
};

} // namespace lmsr

#endif // LMSR_MATH_HPP
