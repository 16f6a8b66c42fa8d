#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "core/date.hpp"

namespace lotledger::valuation {

/// Valuation of one (account, symbol) on one date. Unique per that triple;
/// a later run for the same date replaces it.
struct DailyPnLSnapshot {
    uint64_t id = 0;
    std::string account_id;
    std::string symbol;
    core::Date valuation_date;
    double quantity = 0.0;
    double avg_cost = 0.0;
    double market_price = 0.0;
    double market_value = 0.0;
    double unrealized_pnl = 0.0;
    double unrealized_pnl_pct = 0.0;
    double realized_pnl = 0.0;       // cumulative up to valuation_date
    double realized_pnl_pct = 0.0;
    double total_cost = 0.0;
    core::Date price_date;           // when market_price was observed
    bool is_stale_price = false;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["account_id"] = account_id;
        j["symbol"] = symbol;
        j["valuation_date"] = valuation_date.to_string();
        j["quantity"] = quantity;
        j["avg_cost"] = avg_cost;
        j["market_price"] = market_price;
        j["market_value"] = market_value;
        j["unrealized_pnl"] = unrealized_pnl;
        j["unrealized_pnl_pct"] = unrealized_pnl_pct;
        j["realized_pnl"] = realized_pnl;
        j["realized_pnl_pct"] = realized_pnl_pct;
        j["total_cost"] = total_cost;
        j["price_date"] = price_date.to_string();
        j["is_stale_price"] = is_stale_price;
        return j;
    }

    static DailyPnLSnapshot from_json(const nlohmann::json& j) {
        DailyPnLSnapshot s;
        s.id = j.at("id").get<uint64_t>();
        s.account_id = j.at("account_id").get<std::string>();
        s.symbol = j.at("symbol").get<std::string>();
        s.valuation_date = core::parse_date_or_throw(
            j.at("valuation_date").get<std::string>(), "valuation_date");
        s.quantity = j.at("quantity").get<double>();
        s.avg_cost = j.at("avg_cost").get<double>();
        s.market_price = j.at("market_price").get<double>();
        s.market_value = j.at("market_value").get<double>();
        s.unrealized_pnl = j.at("unrealized_pnl").get<double>();
        s.unrealized_pnl_pct = j.at("unrealized_pnl_pct").get<double>();
        s.realized_pnl = j.at("realized_pnl").get<double>();
        s.realized_pnl_pct = j.at("realized_pnl_pct").get<double>();
        s.total_cost = j.at("total_cost").get<double>();
        s.price_date = core::parse_date_or_throw(
            j.at("price_date").get<std::string>(), "price_date");
        s.is_stale_price = j.at("is_stale_price").get<bool>();
        return s;
    }
};

}  // namespace lotledger::valuation
