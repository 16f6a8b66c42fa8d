#include "booking/position_aggregator.hpp"

#include <spdlog/spdlog.h>

namespace lotledger::booking {

PositionAggregator::PositionAggregator(double quantity_epsilon) : epsilon_(quantity_epsilon) {}

Position PositionAggregator::aggregate(const std::string& account_id, const std::string& symbol,
                                       const std::vector<PositionLot>& lots,
                                       const core::Date& last_transaction_date) const {
    Position pos;
    pos.account_id = account_id;
    pos.symbol = symbol;
    pos.last_transaction_date = last_transaction_date;
    pos.first_buy_date = last_transaction_date;

    bool first = true;
    for (const auto& lot : lots) {
        if (first || lot.purchase_date < pos.first_buy_date) {
            pos.first_buy_date = lot.purchase_date;
            first = false;
        }
        if (lot.is_closed) {
            ++pos.closed_lot_count;
            continue;
        }
        ++pos.open_lot_count;
        pos.quantity += lot.remaining_quantity;
        pos.total_cost += lot.remaining_cost();
    }

    pos.is_active = pos.quantity > epsilon_;
    if (pos.is_active) {
        pos.avg_cost = pos.total_cost / pos.quantity;
    } else {
        pos.quantity = 0.0;
        pos.total_cost = 0.0;
        pos.avg_cost = 0.0;
    }

    spdlog::debug("[POSITION] {} {} | qty {} avg {:.4f} lots {}/{}",
                  account_id, symbol, pos.quantity, pos.avg_cost,
                  pos.open_lot_count, pos.closed_lot_count);
    return pos;
}

}  // namespace lotledger::booking
