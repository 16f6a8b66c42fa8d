#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "core/date.hpp"

namespace lotledger::booking {

/// Materialized view over a symbol's lots. Kept after it goes flat because it
/// anchors the symbol's realized P&L history.
struct Position {
    uint64_t id = 0;
    std::string account_id;
    std::string symbol;
    double quantity = 0.0;
    double avg_cost = 0.0;
    double total_cost = 0.0;
    core::Date first_buy_date;
    core::Date last_transaction_date;
    bool is_active = false;
    size_t open_lot_count = 0;
    size_t closed_lot_count = 0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["account_id"] = account_id;
        j["symbol"] = symbol;
        j["quantity"] = quantity;
        j["avg_cost"] = avg_cost;
        j["total_cost"] = total_cost;
        j["first_buy_date"] = first_buy_date.to_string();
        j["last_transaction_date"] = last_transaction_date.to_string();
        j["is_active"] = is_active;
        j["open_lot_count"] = open_lot_count;
        j["closed_lot_count"] = closed_lot_count;
        return j;
    }

    static Position from_json(const nlohmann::json& j) {
        Position pos;
        pos.id = j.at("id").get<uint64_t>();
        pos.account_id = j.at("account_id").get<std::string>();
        pos.symbol = j.at("symbol").get<std::string>();
        pos.quantity = j.at("quantity").get<double>();
        pos.avg_cost = j.at("avg_cost").get<double>();
        pos.total_cost = j.at("total_cost").get<double>();
        pos.first_buy_date = core::parse_date_or_throw(
            j.at("first_buy_date").get<std::string>(), "first_buy_date");
        pos.last_transaction_date = core::parse_date_or_throw(
            j.at("last_transaction_date").get<std::string>(), "last_transaction_date");
        pos.is_active = j.at("is_active").get<bool>();
        pos.open_lot_count = j.value("open_lot_count", size_t{0});
        pos.closed_lot_count = j.value("closed_lot_count", size_t{0});
        return pos;
    }
};

}  // namespace lotledger::booking
