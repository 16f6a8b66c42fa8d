#pragma once

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/date.hpp"

namespace lotledger::booking {

enum class Side { Buy, Sell };

inline Side side_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "buy") return Side::Buy;
    if (lower == "sell") return Side::Sell;
    throw std::invalid_argument("Unknown side: " + s);
}

inline std::string side_to_string(Side s) {
    switch (s) {
        case Side::Buy:  return "BUY";
        case Side::Sell: return "SELL";
    }
    return "UNKNOWN";
}

/// Candidate trade as submitted by a caller, before validation.
struct TransactionRequest {
    std::string account_id;
    std::optional<std::string> external_id;
    std::string symbol;
    std::string side;
    double quantity = 0.0;
    double price = 0.0;
    double commission = 0.0;
    std::string transaction_date;
    std::string notes;
};

/// Accepted trade. Never mutated or deleted once stored.
struct Transaction {
    uint64_t id = 0;
    std::string account_id;
    std::optional<std::string> external_id;
    std::string symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    double commission = 0.0;
    core::Date transaction_date;
    std::optional<uint64_t> lot_id;  // lot opened by a BUY
    std::string notes;
    std::string created_at;
    std::string updated_at;

    /// Business payload equality, used to tell an idempotent replay from a conflicting one.
    bool same_payload(const Transaction& other) const {
        return symbol == other.symbol && side == other.side &&
               quantity == other.quantity && price == other.price &&
               commission == other.commission &&
               transaction_date == other.transaction_date;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["account_id"] = account_id;
        j["external_id"] = external_id ? nlohmann::json(*external_id) : nlohmann::json(nullptr);
        j["symbol"] = symbol;
        j["side"] = side_to_string(side);
        j["quantity"] = quantity;
        j["price"] = price;
        j["commission"] = commission;
        j["transaction_date"] = transaction_date.to_string();
        j["lot_id"] = lot_id ? nlohmann::json(*lot_id) : nlohmann::json(nullptr);
        j["notes"] = notes;
        j["created_at"] = created_at;
        j["updated_at"] = updated_at;
        return j;
    }

    static Transaction from_json(const nlohmann::json& j) {
        Transaction tx;
        tx.id = j.at("id").get<uint64_t>();
        tx.account_id = j.at("account_id").get<std::string>();
        if (j.contains("external_id") && !j["external_id"].is_null()) {
            tx.external_id = j["external_id"].get<std::string>();
        }
        tx.symbol = j.at("symbol").get<std::string>();
        tx.side = side_from_string(j.at("side").get<std::string>());
        tx.quantity = j.at("quantity").get<double>();
        tx.price = j.at("price").get<double>();
        tx.commission = j.at("commission").get<double>();
        tx.transaction_date = core::parse_date_or_throw(
            j.at("transaction_date").get<std::string>(), "transaction_date");
        if (j.contains("lot_id") && !j["lot_id"].is_null()) {
            tx.lot_id = j["lot_id"].get<uint64_t>();
        }
        tx.notes = j.value("notes", "");
        tx.created_at = j.value("created_at", "");
        tx.updated_at = j.value("updated_at", "");
        return tx;
    }
};

}  // namespace lotledger::booking
