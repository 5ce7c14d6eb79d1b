#pragma once

#include <cstddef>
#include <cstdint>

#if !defined(LMSR_MAX_OUTCOMES)
#  define LMSR_MAX_OUTCOMES 16
#endif

#if LMSR_MAX_OUTCOMES < 2 || LMSR_MAX_OUTCOMES > 255
#  error "LMSR_MAX_OUTCOMES must be in [2, 255] (num_outcomes is stored as uint8_t)"
#endif

namespace lmsr {

constexpr size_t MAX_OUTCOMES = LMSR_MAX_OUTCOMES;
constexpr uint8_t MINIMUM_OUTCOMES_PER_MARKET = 2;

// Outcome shares carry 9 decimals (D9), same as prices.
constexpr uint8_t OUTCOME_SHARE_DECIMALS = 9;

constexpr size_t MAX_LABEL_LENGTH = 32;

// Opaque account key of the market administrator
constexpr size_t ADMIN_KEY_LENGTH = 32;

} // namespace lmsr
