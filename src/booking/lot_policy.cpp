#include "booking/lot_policy.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <tuple>

namespace lotledger::booking {

std::vector<size_t> FifoPolicy::consumption_order(const std::vector<PositionLot>& lots) const {
    std::vector<size_t> order(lots.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&lots](size_t a, size_t b) {
        const auto& la = lots[a];
        const auto& lb = lots[b];
        return std::tie(la.purchase_date, la.transaction_id, la.id) <
               std::tie(lb.purchase_date, lb.transaction_id, lb.id);
    });
    return order;
}

std::unique_ptr<LotSelectionPolicy> make_lot_policy(const std::string& name) {
    if (name == "fifo" || name == "FIFO") return std::make_unique<FifoPolicy>();
    throw std::invalid_argument("Unknown cost basis method: " + name);
}

}  // namespace lotledger::booking
