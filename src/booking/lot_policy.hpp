#pragma once

#include <memory>
#include <string>
#include <vector>

#include "booking/position_lot.hpp"

namespace lotledger::booking {

/// Decides which open lots a sale consumes first.
class LotSelectionPolicy {
public:
    virtual ~LotSelectionPolicy() = default;

    virtual std::string name() const = 0;

    /// Indices into `lots`, in consumption order. Only open lots are passed in.
    virtual std::vector<size_t> consumption_order(const std::vector<PositionLot>& lots) const = 0;
};

/// Oldest purchase first; same-day lots in creation order.
class FifoPolicy : public LotSelectionPolicy {
public:
    std::string name() const override { return "fifo"; }
    std::vector<size_t> consumption_order(const std::vector<PositionLot>& lots) const override;
};

/// Build a policy by its config name. Throws std::invalid_argument for unknown names.
std::unique_ptr<LotSelectionPolicy> make_lot_policy(const std::string& name);

}  // namespace lotledger::booking
