#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>

namespace lotledger::booking {

/// One slice of a SELL taken from one lot. Immutable once created.
struct SaleAllocation {
    uint64_t id = 0;
    uint64_t sale_transaction_id = 0;
    uint64_t lot_id = 0;
    double quantity_sold = 0.0;
    double cost_basis = 0.0;
    double sale_price = 0.0;
    double realized_pnl = 0.0;
    double commission_allocated = 0.0;

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"sale_transaction_id", sale_transaction_id},
            {"lot_id", lot_id},
            {"quantity_sold", quantity_sold},
            {"cost_basis", cost_basis},
            {"sale_price", sale_price},
            {"realized_pnl", realized_pnl},
            {"commission_allocated", commission_allocated},
        };
    }

    static SaleAllocation from_json(const nlohmann::json& j) {
        SaleAllocation a;
        a.id = j.at("id").get<uint64_t>();
        a.sale_transaction_id = j.at("sale_transaction_id").get<uint64_t>();
        a.lot_id = j.at("lot_id").get<uint64_t>();
        a.quantity_sold = j.at("quantity_sold").get<double>();
        a.cost_basis = j.at("cost_basis").get<double>();
        a.sale_price = j.at("sale_price").get<double>();
        a.realized_pnl = j.at("realized_pnl").get<double>();
        a.commission_allocated = j.at("commission_allocated").get<double>();
        return a;
    }
};

}  // namespace lotledger::booking
