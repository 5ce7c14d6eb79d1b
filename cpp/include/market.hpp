// LMSR market (templated on the outcome bound)
//
// C(q) = b * ln(sum_i exp(q_i / b)), with q_i the D9 share supply of outcome i
// and b the liquidity parameter in settlement base units.
#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "lmsr_config.hpp"
#include "lmsr_errors.hpp"
#include "lmsr_math.hpp"

namespace lmsr {

template <size_t MaxOutcomes>
class MarketT {
public:
    using Math = LmsrMath;
    static constexpr size_t MAX_OUTCOMES = MaxOutcomes;

    // Cumulative base units paid into each outcome
    std::array<uint64_t, MaxOutcomes> reserves{};

    // Cumulative D9 shares minted for each outcome
    std::array<uint64_t, MaxOutcomes> supplies{};

    // Liquidity parameter b, same unit as reserves. Higher means a flatter
    // price response to trades.
    uint64_t scale = 0;

    uint8_t num_outcomes = 0;

    // Lifecycle metadata; carried for the owning layer, never read here
    std::array<uint8_t, ADMIN_KEY_LENGTH> admin{};
    uint64_t initialized_at = 0;
    int64_t resolve_at = 0;
    std::string label;

public:
    MarketT() = default;

    MarketT(
        size_t _num_outcomes,
        uint64_t _scale,
        std::string _label = std::string(),
        int64_t _resolve_at = 0,
        uint64_t _initialized_at = 0,
        const std::array<uint8_t, ADMIN_KEY_LENGTH>& _admin = {}
    ) {
        if (_num_outcomes < MINIMUM_OUTCOMES_PER_MARKET) {
            throw market_error(errc::not_enough_outcomes);
        }
        if (_num_outcomes > MaxOutcomes) {
            throw market_error(errc::too_many_outcomes);
        }
        if (_label.size() > MAX_LABEL_LENGTH) {
            throw market_error(errc::invalid_label_length);
        }
        num_outcomes = static_cast<uint8_t>(_num_outcomes);
        scale = _scale;
        label = std::move(_label);
        resolve_at = _resolve_at;
        initialized_at = _initialized_at;
        admin = _admin;
    }

private:
    // ------------------------ Internal helpers ------------------------

    void _check_outcome_bound() const {
        if (num_outcomes > MaxOutcomes) {
            throw market_error(errc::too_many_outcomes);
        }
    }

    void _check_scale() const {
        if (scale == 0) {
            throw market_error(errc::liquidity_parameter_is_zero);
        }
    }

    void _check_index(size_t outcome_index) const {
        if (outcome_index >= num_outcomes) {
            throw market_error(errc::invalid_outcome_index);
        }
    }

    // q / b as a D9 ratio: q is D9 shares, b is in base units
    int128 _ratio(uint64_t q) const {
        return int128(q) * D9_I128 / int128(scale);
    }

    // S = sum_j exp(q_j / b)
    uint128 _sum_exp() const {
        uint128 sum_exp = 0;
        for (size_t j = 0; j < num_outcomes; ++j) {
            sum_exp = Math::checked_add(sum_exp, Math::fp_exp(_ratio(supplies[j])));
        }
        return sum_exp;
    }

public:
    // ------------------------ Views ------------------------

    // Cost function in base units: how much has to back the current supplies.
    uint64_t cost() const {
        _check_outcome_bound();
        _check_scale();

        int128 ln_sum = Math::fp_ln(_sum_exp());
        int128 cost_d9 = Math::checked_mul(int128(scale), ln_sum) / D9_I128;

        if (cost_d9 < 0) {
            throw market_error(errc::math_overflow, "negative cost");
        }
        return Math::to_u64(cost_d9);
    }

    // Probability of an outcome in D9 (1.0 == 1000000000):
    // p_i = exp(q_i / b) / sum_j exp(q_j / b)
    uint64_t price(size_t outcome_index) const {
        _check_outcome_bound();
        _check_index(outcome_index);
        _check_scale();

        uint128 exp_qi = Math::fp_exp(_ratio(supplies[outcome_index]));
        uint128 sum_exp = _sum_exp();

        // Should not occur: fp_exp of a non-negative ratio is at least 1.0
        if (sum_exp == 0) {
            return 0;
        }

        uint128 p = Math::checked_mul(exp_qi, D9_U128) / sum_exp;
        if (p > std::numeric_limits<uint64_t>::max()) {
            return std::numeric_limits<uint64_t>::max();
        }
        return p.convert_to<uint64_t>();
    }

    // ------------------------ API ------------------------

    // buy_shares: pay amount_in base units into an outcome, mint shares.
    //   dq = b * ln(S * (exp(amount_in / b) - 1) / exp(q_i / b) + 1)
    // Supplies and reserves of the outcome are updated together or not at all.
    uint64_t buy_shares(size_t outcome_index, uint64_t amount_in) {
        _check_outcome_bound();
        _check_index(outcome_index);
        if (amount_in == 0) {
            throw market_error(errc::deposit_is_zero);
        }
        _check_scale();

        uint128 sum_exp = _sum_exp();
        uint128 exp_qi = Math::fp_exp(_ratio(supplies[outcome_index]));
        uint128 exp_amount = Math::fp_exp(_ratio(amount_in));

        uint128 numerator = Math::checked_mul(
            sum_exp,
            Math::checked_sub(exp_amount, D9_U128)
        ) / D9_U128;

        uint128 fraction = Math::checked_div(numerator, exp_qi);
        uint128 ln_arg = Math::checked_add(fraction, D9_U128);
        int128 ln_result = Math::fp_ln(ln_arg);

        // b * ln(...) is already D9 shares
        int128 shares = Math::checked_mul(int128(scale), ln_result);
        if (shares <= 0) {
            throw market_error(errc::shares_are_zero);
        }
        uint64_t shares_out = Math::to_u64(shares);

        uint64_t new_supply = Math::checked_add(supplies[outcome_index], shares_out);
        uint64_t new_reserve = Math::checked_add(reserves[outcome_index], amount_in);

        // Commit
        supplies[outcome_index] = new_supply;
        reserves[outcome_index] = new_reserve;

        return shares_out;
    }
};

using Market = MarketT<MAX_OUTCOMES>;

} // namespace lmsr
