#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "market.hpp"

namespace lmsr {

struct TradeAction {
    size_t outcome{0};
    uint64_t amount{0};
};

// Quoted view of a market. When cost/price cannot be evaluated the quote
// fields stay zero and quote_error holds the reason.
struct MarketSnapshot {
    std::vector<uint64_t> supplies;
    std::vector<uint64_t> reserves;
    uint64_t cost{0};
    std::vector<uint64_t> prices;
    uint64_t price_sum{0};
    std::optional<errc> quote_error;
};

struct ActionResult {
    bool success{false};
    std::optional<errc> error;
    std::string message;
    uint64_t shares_minted{0};
    std::optional<MarketSnapshot> snapshot;
};

struct RunResult {
    size_t trades{0};
    size_t failed{0};
    std::vector<ActionResult> actions;
    MarketSnapshot final_state;
};

class MarketRunner {
public:
    explicit MarketRunner(Market market)
        : market_(std::move(market)) {}

    static MarketSnapshot snapshot(const Market& m) {
        MarketSnapshot s;
        size_t n = std::min<size_t>(m.num_outcomes, Market::MAX_OUTCOMES);
        s.supplies.assign(m.supplies.begin(), m.supplies.begin() + n);
        s.reserves.assign(m.reserves.begin(), m.reserves.begin() + n);
        if (m.num_outcomes > Market::MAX_OUTCOMES) {
            s.quote_error = errc::too_many_outcomes;
            return s;
        }
        try {
            uint64_t cost = m.cost();
            std::vector<uint64_t> prices;
            uint64_t price_sum = 0;
            for (size_t i = 0; i < m.num_outcomes; ++i) {
                prices.push_back(m.price(i));
                price_sum = LmsrMath::checked_add(price_sum, prices.back());
            }
            s.cost = cost;
            s.prices = std::move(prices);
            s.price_sum = price_sum;
        } catch (const market_error& e) {
            s.quote_error = e.code();
        }
        return s;
    }

    // Executes one purchase. Market errors are recorded, not rethrown.
    ActionResult apply(const TradeAction& action) {
        ActionResult r;
        try {
            r.shares_minted = market_.buy_shares(action.outcome, action.amount);
            r.success = true;
        } catch (const market_error& e) {
            r.error = e.code();
            r.message = e.what();
        }
        return r;
    }

    // snapshot_every: 1 = after every action, k = every k-th action, 0 = none
    RunResult run(const std::vector<TradeAction>& actions, size_t snapshot_every = 1) {
        RunResult result;
        size_t idx = 0;
        for (const auto& action : actions) {
            ActionResult r = apply(action);
            if (r.success) {
                ++result.trades;
            } else {
                ++result.failed;
            }
            if (snapshot_every != 0 && ((idx + 1) % snapshot_every) == 0) {
                r.snapshot = snapshot(market_);
            }
            result.actions.push_back(std::move(r));
            ++idx;
        }
        result.final_state = snapshot(market_);
        return result;
    }

    const Market& market() const { return market_; }

private:
    Market market_;
};

} // namespace lmsr
