#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "booking/lot_policy.hpp"
#include "booking/position_lot.hpp"
#include "booking/sale_allocation.hpp"
#include "booking/transaction.hpp"

namespace lotledger::booking {

/// Lot changes produced by one transaction. Nothing here is stored yet.
struct AllocationOutcome {
    std::optional<PositionLot> opened_lot;
    std::vector<PositionLot> updated_lots;  // consumed lots, post-sale state
    std::vector<SaleAllocation> allocations;

    double quantity_allocated() const {
        double total = 0.0;
        for (const auto& a : allocations) total += a.quantity_sold;
        return total;
    }

    double realized_pnl() const {
        double total = 0.0;
        for (const auto& a : allocations) total += a.realized_pnl;
        return total;
    }
};

/// Per-(account, symbol) lot state machine. Lots go OPEN -> CLOSED only.
/// Works on copies of the lot set so a rejected sale changes nothing.
class LotAllocationEngine {
public:
    using IdSource = std::function<uint64_t()>;

    explicit LotAllocationEngine(std::unique_ptr<LotSelectionPolicy> policy,
                                 double quantity_epsilon = 1e-9);

    /// BUY: a new lot holding the whole quantity.
    PositionLot open_lot(const Transaction& buy, uint64_t lot_id) const;

    /// SELL: consume open lots in policy order, one allocation per lot touched.
    /// Throws InsufficientLotsError, before asking for any id, when the open
    /// quantity cannot cover the sale.
    AllocationOutcome consume_lots(const Transaction& sell,
                                   const std::vector<PositionLot>& lots,
                                   const IdSource& next_allocation_id) const;

    /// Per-unit cost including the buy commission.
    static double cost_basis(double quantity, double price, double commission);

    double open_quantity(const std::vector<PositionLot>& lots) const;

    const LotSelectionPolicy& policy() const { return *policy_; }
    double quantity_epsilon() const { return epsilon_; }

private:
    std::unique_ptr<LotSelectionPolicy> policy_;
    double epsilon_;
};

/// `lots` with the outcome's lot updates applied and its opened lot appended.
std::vector<PositionLot> lots_after(std::vector<PositionLot> lots, const AllocationOutcome& outcome);

}  // namespace lotledger::booking
