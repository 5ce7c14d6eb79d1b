// C API wrapper exposing LMSR fixed-point math and market operations over decimal strings
#include "lmsr_capi.h"
#include "market.hpp"
#include <string>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

using lmsr::int128;
using lmsr::uint128;
using lmsr::int256;
using lmsr::uint256;
using lmsr::Market;

namespace {

thread_local int last_error = 0;

// Errors that are not market_error (parse failures, bad arguments)
constexpr int LMSR_ERR_INVALID_ARGUMENT = -1;

char* alloc_cstr(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

std::string require(const char* s) {
    if (!s || !*s) throw std::invalid_argument("missing numeric argument");
    return std::string(s);
}

uint64_t to_u64(const char* s) {
    std::string str = require(s);
    if (str.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not an unsigned decimal");
    }
    return std::stoull(str);
}

// Longer inputs could wrap even the 256-bit parse
constexpr size_t MAX_WIDE_DIGITS = 40;

const std::string& require_digits(const std::string& str, size_t from) {
    if (from >= str.size() || str.find_first_not_of("0123456789", from) != std::string::npos) {
        throw std::invalid_argument("not a decimal integer");
    }
    if (str.size() - from > MAX_WIDE_DIGITS) {
        throw std::invalid_argument("value exceeds 128 bits");
    }
    return str;
}

int128 to_i128(const char* s) {
    std::string str = require(s);
    int256 wide(require_digits(str, str[0] == '-' ? 1 : 0));
    if (wide > (int256(1) << 127) - 1 || wide < -(int256(1) << 127)) {
        throw std::invalid_argument("value exceeds signed 128 bits");
    }
    return static_cast<int128>(wide);
}

uint128 to_u128(const char* s) {
    uint256 wide(require_digits(require(s), 0));
    if (wide > (uint256(1) << 128) - 1) {
        throw std::invalid_argument("value exceeds unsigned 128 bits");
    }
    return static_cast<uint128>(wide);
}

Market to_market(const char* scale, const char* const* supplies, const char* const* reserves, int n) {
    if (n < 0) throw std::invalid_argument("negative outcome count");
    Market m(static_cast<size_t>(n), to_u64(scale));
    for (int i = 0; i < n; ++i) {
        m.supplies[i] = supplies ? to_u64(supplies[i]) : 0;
        m.reserves[i] = reserves ? to_u64(reserves[i]) : 0;
    }
    return m;
}

// Runs fn, translating exceptions into last_error and a nullptr result
template <typename Fn>
auto guarded(Fn fn) -> decltype(fn()) {
    try {
        auto out = fn();
        last_error = 0;
        return out;
    } catch (const lmsr::market_error& e) {
        last_error = static_cast<int>(e.code());
    } catch (const std::exception&) {
        last_error = LMSR_ERR_INVALID_ARGUMENT;
    }
    return nullptr;
}

} // namespace

extern "C" {

int lmsr_last_error(void) {
    return last_error;
}

char* lmsr_fp_exp(const char* x) {
    return guarded([&]() {
        int128 x_val = to_i128(x);
        return alloc_cstr(lmsr::LmsrMath::fp_exp(x_val).str());
    });
}

char* lmsr_fp_ln(const char* x) {
    return guarded([&]() {
        uint128 x_val = to_u128(x);
        return alloc_cstr(lmsr::LmsrMath::fp_ln(x_val).str());
    });
}

char* lmsr_cost(const char* scale, const char* const* supplies, int n) {
    return guarded([&]() {
        Market m = to_market(scale, supplies, nullptr, n);
        return alloc_cstr(std::to_string(m.cost()));
    });
}

char* lmsr_price(const char* scale, const char* const* supplies, int n, int index) {
    return guarded([&]() {
        if (index < 0) throw lmsr::market_error(lmsr::errc::invalid_outcome_index);
        Market m = to_market(scale, supplies, nullptr, n);
        return alloc_cstr(std::to_string(m.price(static_cast<size_t>(index))));
    });
}

// -> char** (length 3): shares minted, new supply, new reserve of the outcome
char** lmsr_buy_shares(const char* scale, const char* const* supplies, const char* const* reserves,
                       int n, int index, const char* amount_in) {
    return guarded([&]() -> char** {
        if (index < 0) throw lmsr::market_error(lmsr::errc::invalid_outcome_index);
        Market m = to_market(scale, supplies, reserves, n);
        size_t idx = static_cast<size_t>(index);
        uint64_t shares = m.buy_shares(idx, to_u64(amount_in));
        char** arr = static_cast<char**>(std::malloc(sizeof(char*) * 3));
        if (!arr) throw std::runtime_error("out of memory");
        arr[0] = alloc_cstr(std::to_string(shares));
        arr[1] = alloc_cstr(std::to_string(m.supplies[idx]));
        arr[2] = alloc_cstr(std::to_string(m.reserves[idx]));
        return arr;
    });
}

void lmsr_free_string(char* p) {
    if (p) std::free(p);
}

void lmsr_free_string_array(char** arr, int n) {
    if (!arr) return;
    for (int i = 0; i < n; ++i) {
        if (arr[i]) std::free(arr[i]);
    }
    std::free(arr);
}

} // extern "C"
