#include "booking/lot_allocation_engine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace lotledger::booking {

LotAllocationEngine::LotAllocationEngine(std::unique_ptr<LotSelectionPolicy> policy,
                                         double quantity_epsilon)
    : policy_(std::move(policy)), epsilon_(quantity_epsilon) {
    if (!policy_) {
        policy_ = std::make_unique<FifoPolicy>();
    }
}

double LotAllocationEngine::cost_basis(double quantity, double price, double commission) {
    return (price * quantity + commission) / quantity;
}

PositionLot LotAllocationEngine::open_lot(const Transaction& buy, uint64_t lot_id) const {
    PositionLot lot;
    lot.id = lot_id;
    lot.account_id = buy.account_id;
    lot.symbol = buy.symbol;
    lot.transaction_id = buy.id;
    lot.original_quantity = buy.quantity;
    lot.remaining_quantity = buy.quantity;
    lot.cost_basis = cost_basis(buy.quantity, buy.price, buy.commission);
    lot.purchase_date = buy.transaction_date;
    lot.is_closed = false;

    spdlog::debug("[LOTS] Open lot {} | {} {} {} @ {:.4f} on {}",
                  lot.id, lot.account_id, lot.symbol, lot.original_quantity,
                  lot.cost_basis, lot.purchase_date.to_string());
    return lot;
}

double LotAllocationEngine::open_quantity(const std::vector<PositionLot>& lots) const {
    double total = 0.0;
    for (const auto& lot : lots) {
        if (!lot.is_closed && lot.remaining_quantity > epsilon_) total += lot.remaining_quantity;
    }
    return total;
}

AllocationOutcome LotAllocationEngine::consume_lots(const Transaction& sell,
                                                    const std::vector<PositionLot>& lots,
                                                    const IdSource& next_allocation_id) const {
    std::vector<PositionLot> open;
    for (const auto& lot : lots) {
        if (!lot.is_closed && lot.remaining_quantity > epsilon_) open.push_back(lot);
    }

    double available = open_quantity(open);
    if (available < sell.quantity - epsilon_) {
        throw core::InsufficientLotsError(sell.symbol, sell.quantity, available);
    }

    AllocationOutcome outcome;
    double to_sell = sell.quantity;
    double commission_left = sell.commission;

    for (size_t idx : policy_->consumption_order(open)) {
        if (to_sell <= epsilon_) break;

        PositionLot lot = open[idx];
        double taken = std::min(lot.remaining_quantity, to_sell);
        to_sell -= taken;

        // Pro-rata commission share; the final slice takes the remainder so the
        // shares add up to the sale's commission exactly.
        bool last_slice = to_sell <= epsilon_;
        double commission_share = last_slice
            ? commission_left
            : sell.commission * taken / sell.quantity;
        commission_left -= commission_share;

        SaleAllocation alloc;
        alloc.id = next_allocation_id();
        alloc.sale_transaction_id = sell.id;
        alloc.lot_id = lot.id;
        alloc.quantity_sold = taken;
        alloc.cost_basis = lot.cost_basis;
        alloc.sale_price = sell.price;
        alloc.commission_allocated = commission_share;
        alloc.realized_pnl = (sell.price - lot.cost_basis) * taken - commission_share;

        lot.remaining_quantity -= taken;
        if (lot.remaining_quantity <= epsilon_) {
            lot.remaining_quantity = 0.0;
            lot.is_closed = true;
        }

        spdlog::debug("[LOTS] Allocate lot {} -> sale {} | {} @ {:.4f} cost {:.4f} pnl {:.2f}{}",
                      lot.id, sell.id, taken, sell.price, lot.cost_basis,
                      alloc.realized_pnl, lot.is_closed ? " (closed)" : "");

        outcome.allocations.push_back(alloc);
        outcome.updated_lots.push_back(std::move(lot));
    }

    return outcome;
}

std::vector<PositionLot> lots_after(std::vector<PositionLot> lots, const AllocationOutcome& outcome) {
    for (const auto& updated : outcome.updated_lots) {
        auto it = std::find_if(lots.begin(), lots.end(),
                               [&](const PositionLot& l) { return l.id == updated.id; });
        if (it != lots.end()) *it = updated;
    }
    if (outcome.opened_lot) lots.push_back(*outcome.opened_lot);
    return lots;
}

}  // namespace lotledger::booking
