#ifndef LMSR_ERRORS_HPP
#define LMSR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lmsr {

// Every failure the core can report. Values are stable: the C ABI hands
// them out as plain ints (0 means success).
enum class errc : int {
    math_overflow = 1,
    math_domain,
    invalid_outcome_index,
    too_many_outcomes,
    not_enough_outcomes,
    liquidity_parameter_is_zero,
    invalid_label_length,
    deposit_is_zero,
    shares_are_zero,
};

const char* describe(errc code) noexcept;

class market_error : public std::runtime_error {
public:
    explicit market_error(errc code);
    market_error(errc code, const std::string& detail);

    errc code() const noexcept { return code_; }

private:
    errc code_;
};

} // namespace lmsr

#endif // LMSR_ERRORS_HPP
