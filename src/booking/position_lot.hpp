#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "core/date.hpp"

namespace lotledger::booking {

/// Quantity acquired by exactly one BUY. remaining_quantity only ever decreases;
/// a closed lot is kept for audit and never reopens.
struct PositionLot {
    uint64_t id = 0;
    std::string account_id;
    std::string symbol;
    uint64_t transaction_id = 0;
    double original_quantity = 0.0;
    double remaining_quantity = 0.0;
    double cost_basis = 0.0;  // per unit, buy commission included
    core::Date purchase_date;
    bool is_closed = false;

    double remaining_cost() const { return remaining_quantity * cost_basis; }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["account_id"] = account_id;
        j["symbol"] = symbol;
        j["transaction_id"] = transaction_id;
        j["original_quantity"] = original_quantity;
        j["remaining_quantity"] = remaining_quantity;
        j["cost_basis"] = cost_basis;
        j["purchase_date"] = purchase_date.to_string();
        j["is_closed"] = is_closed;
        return j;
    }

    static PositionLot from_json(const nlohmann::json& j) {
        PositionLot lot;
        lot.id = j.at("id").get<uint64_t>();
        lot.account_id = j.at("account_id").get<std::string>();
        lot.symbol = j.at("symbol").get<std::string>();
        lot.transaction_id = j.at("transaction_id").get<uint64_t>();
        lot.original_quantity = j.at("original_quantity").get<double>();
        lot.remaining_quantity = j.at("remaining_quantity").get<double>();
        lot.cost_basis = j.at("cost_basis").get<double>();
        lot.purchase_date = core::parse_date_or_throw(
            j.at("purchase_date").get<std::string>(), "purchase_date");
        lot.is_closed = j.at("is_closed").get<bool>();
        return lot;
    }
};

}  // namespace lotledger::booking
