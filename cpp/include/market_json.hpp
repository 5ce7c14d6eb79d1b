// JSON codec for harness inputs and snapshots (Boost.JSON)
//
// Exactly one translation unit per binary must also include
// <boost/json/src.hpp>.
#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "market_runner.hpp"

namespace lmsr {

namespace json = boost::json;

// Amounts arrive as JSON numbers or as decimal strings (u64 does not
// survive every JSON reader).
inline uint64_t parse_u64(const json::value& v) {
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64()) {
        auto x = v.as_int64();
        if (x < 0) throw std::invalid_argument("negative value where an unsigned integer was expected");
        return static_cast<uint64_t>(x);
    }
    if (v.is_string()) {
        std::string s(v.as_string().c_str());
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c){ return c >= '0' && c <= '9'; })) {
            throw std::invalid_argument("not an unsigned decimal: '" + s + "'");
        }
        return std::stoull(s);
    }
    throw std::invalid_argument("expected unsigned integer (number or decimal string)");
}

inline json::array to_json(const std::vector<uint64_t>& v) {
    json::array a;
    for (auto x : v) a.push_back(json::value(std::to_string(x)));
    return a;
}

inline json::object to_json(const MarketSnapshot& s) {
    json::object o;
    o["supplies"] = to_json(s.supplies);
    o["reserves"] = to_json(s.reserves);
    if (s.quote_error) {
        o["quote_error"] = describe(*s.quote_error);
    } else {
        o["cost"] = std::to_string(s.cost);
        o["prices"] = to_json(s.prices);
        o["price_sum"] = std::to_string(s.price_sum);
    }
    return o;
}

inline Market market_from_json(const json::object& m) {
    std::string label = m.if_contains("label") ? std::string(m.at("label").as_string().c_str()) : std::string();
    int64_t resolve_at = m.if_contains("resolve_at") ? m.at("resolve_at").to_number<int64_t>() : 0;
    uint64_t initialized_at = m.if_contains("initialized_at") ? parse_u64(m.at("initialized_at")) : 0;
    return Market(
        static_cast<size_t>(parse_u64(m.at("num_outcomes"))),
        parse_u64(m.at("scale")),
        label,
        resolve_at,
        initialized_at
    );
}

inline std::vector<TradeAction> actions_from_json(const json::array& arr) {
    std::vector<TradeAction> out;
    out.reserve(arr.size());
    for (const auto& a : arr) {
        const auto& act = a.as_object();
        auto type = act.at("type").as_string();
        if (type != "buy") {
            throw std::invalid_argument("unknown action type: " + std::string(type.c_str()));
        }
        out.push_back({static_cast<size_t>(parse_u64(act.at("outcome"))), parse_u64(act.at("amount"))});
    }
    return out;
}

// Snapshot cadence from SAVE_LAST_ONLY / SNAPSHOT_EVERY (either may be null).
// every == 0 keeps the final state only.
struct SnapshotPolicy {
    size_t every{1};
    bool invalid_every{false};
};

inline SnapshotPolicy snapshot_policy(const char* save_last_only, const char* snapshot_every) {
    SnapshotPolicy p;
    bool last_only = save_last_only && std::string(save_last_only) == "1";
    if (snapshot_every) {
        try {
            long v = std::stol(snapshot_every);
            p.every = v <= 0 ? 0 : static_cast<size_t>(v);
        } catch (const std::exception&) {
            p.invalid_every = true;
            if (last_only) p.every = 0;
        }
    } else if (last_only) {
        p.every = 0;
    }
    return p;
}

} // namespace lmsr
