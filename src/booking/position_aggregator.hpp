#pragma once

#include <string>
#include <vector>

#include "booking/position.hpp"
#include "booking/position_lot.hpp"

namespace lotledger::booking {

/// Derives a Position from a symbol's lots. Pure: the same lot set always
/// yields the same position, whether recomputed wholesale or after each change.
class PositionAggregator {
public:
    explicit PositionAggregator(double quantity_epsilon = 1e-9);

    /// `lots` is every lot of the symbol, closed ones included (they still
    /// count towards first_buy_date). The returned position has no id.
    Position aggregate(const std::string& account_id, const std::string& symbol,
                       const std::vector<PositionLot>& lots,
                       const core::Date& last_transaction_date) const;

private:
    double epsilon_;
};

}  // namespace lotledger::booking
