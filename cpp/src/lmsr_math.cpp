#include "lmsr_math.hpp"

#include <limits>

namespace lmsr {

namespace {

// Working-width bounds. Boost's int128_t is signed-magnitude and holds
// +/-(2^128 - 1), so the two's-complement i128 range is enforced by hand.
const int256& i128_max() {
    static const int256 v = (int256(1) << 127) - 1;
    return v;
}

const int256& i128_min() {
    static const int256 v = -(int256(1) << 127);
    return v;
}

const uint256& u128_max() {
    static const uint256 v = (uint256(1) << 128) - 1;
    return v;
}

int128 narrow_signed(const int256& wide) {
    if (wide > i128_max() || wide < i128_min()) {
        throw market_error(errc::math_overflow, "signed 128-bit range exceeded");
    }
    return static_cast<int128>(wide);
}

uint128 narrow_unsigned(const uint256& wide) {
    if (wide > u128_max()) {
        throw market_error(errc::math_overflow, "unsigned 128-bit range exceeded");
    }
    return static_cast<uint128>(wide);
}

} // namespace

// ------------------------------ checked ops ---------------------------------

int128 LmsrMath::checked_add(const int128& a, const int128& b) {
    return narrow_signed(int256(a) + int256(b));
}

int128 LmsrMath::checked_mul(const int128& a, const int128& b) {
    return narrow_signed(int256(a) * int256(b));
}

uint128 LmsrMath::checked_add(const uint128& a, const uint128& b) {
    return narrow_unsigned(uint256(a) + uint256(b));
}

uint128 LmsrMath::checked_sub(const uint128& a, const uint128& b) {
    if (b > a) {
        throw market_error(errc::math_overflow, "unsigned subtraction underflow");
    }
    return a - b;
}

uint128 LmsrMath::checked_mul(const uint128& a, const uint128& b) {
    return narrow_unsigned(uint256(a) * uint256(b));
}

uint128 LmsrMath::checked_div(const uint128& a, const uint128& b) {
    if (b == 0) {
        throw market_error(errc::math_overflow, "division by zero");
    }
    return a / b;
}

uint64_t LmsrMath::checked_add(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        throw market_error(errc::math_overflow, "u64 addition overflow");
    }
    return a + b;
}

uint64_t LmsrMath::to_u64(const int128& v) {
    if (v < 0 || v > int128(std::numeric_limits<uint64_t>::max())) {
        throw market_error(errc::math_overflow, "value does not fit u64");
    }
    return v.convert_to<uint64_t>();
}

// -------------------------------- fp_exp ------------------------------------

uint128 LmsrMath::fp_exp(const int128& x) {
    if (x >= EXP_MAX_INPUT) {
        return std::numeric_limits<uint128>::max();
    }
    if (x <= EXP_MIN_INPUT) {
        return 0;
    }

    // e^x = 1 + x + x^2/2! + x^3/3! + ...
    int128 result = D9_I128;
    int128 term = D9_I128;

    for (int n = 1; n <= SERIES_MAX_TERMS; ++n) {
        term = checked_mul(term, x) / D9_I128 / int128(n);

        // |term| < 1 ULP
        if (term == 0) {
            break;
        }

        result = checked_add(result, term);
    }

    // Truncation near the lower clamp can leave the sum below zero
    if (result < 0) {
        return 0;
    }
    return static_cast<uint128>(result);
}

// --------------------------------- fp_ln ------------------------------------

int128 LmsrMath::fp_ln(const uint128& x) {
    if (x == 0) {
        throw market_error(errc::math_domain, "ln(0) is undefined");
    }
    if (int256(x) > i128_max()) {
        throw market_error(errc::math_overflow, "fp_ln argument exceeds signed 128-bit range");
    }

    // ln(x) = sign * ln(cur) + offset, folded until cur lies in [1, 2)
    int128 cur = static_cast<int128>(x);
    int128 sign = 1;
    int128 offset = 0;

    for (int reductions = 0;; ++reductions) {
        if (reductions > LN_MAX_REDUCTIONS) {
            throw market_error(errc::math_overflow, "fp_ln range reduction did not converge");
        }
        if (cur == D9_I128) {
            // ln(1) = 0
            return offset;
        }
        if (cur < D9_I128) {
            // ln(x) = -ln(1/x)
            cur = D18_I128 / cur;
            sign = -sign;
            continue;
        }
        if (cur >= 2 * D9_I128) {
            // ln(x) = ln(x/e) + 1
            cur = checked_mul(cur, D9_I128) / E_SCALED;
            offset = checked_add(offset, int128(sign * D9_I128));
            continue;
        }
        break;
    }

    // ln(1+y) = y - y^2/2 + y^3/3 - ...
    const int128 y = cur - D9_I128;
    int128 series = 0;
    int128 y_power = y;

    for (int n = 1; n <= SERIES_MAX_TERMS; ++n) {
        int128 term = (n % 2 == 1 ? y_power : int128(-y_power)) / int128(n);

        if (term == 0) {
            break;
        }

        series = checked_add(series, term);
        y_power = checked_mul(y_power, y) / D9_I128;
    }

    return checked_add(offset, int128(sign * series));
}

} // namespace lmsr
