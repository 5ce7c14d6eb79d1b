#include "lmsr_errors.hpp"

namespace lmsr {

const char* describe(errc code) noexcept {
    switch (code) {
        case errc::math_overflow:               return "math overflow";
        case errc::math_domain:                 return "math domain error";
        case errc::invalid_outcome_index:       return "invalid outcome index";
        case errc::too_many_outcomes:           return "too many outcomes";
        case errc::not_enough_outcomes:         return "outcome count is below two";
        case errc::liquidity_parameter_is_zero: return "liquidity parameter is zero";
        case errc::invalid_label_length:        return "invalid label length";
        case errc::deposit_is_zero:             return "deposit is zero";
        case errc::shares_are_zero:             return "shares are zero";
    }
    return "unknown error";
}

market_error::market_error(errc code)
    : std::runtime_error(describe(code)), code_(code) {}

market_error::market_error(errc code, const std::string& detail)
    : std::runtime_error(std::string(describe(code)) + ": " + detail), code_(code) {}

} // namespace lmsr
