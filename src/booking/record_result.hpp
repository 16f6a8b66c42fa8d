#pragma once

#include <optional>
#include <string>
#include <vector>

#include "booking/position.hpp"
#include "booking/position_lot.hpp"
#include "booking/sale_allocation.hpp"
#include "booking/transaction.hpp"

namespace lotledger::booking {

enum class RecordStatus { Applied, AlreadyApplied, Rejected };
enum class RejectReason { None, Validation, InsufficientLots, DuplicateTransaction };

inline std::string status_to_string(RecordStatus s) {
    switch (s) {
        case RecordStatus::Applied:        return "applied";
        case RecordStatus::AlreadyApplied: return "already_applied";
        case RecordStatus::Rejected:       return "rejected";
    }
    return "unknown";
}

inline std::string reason_to_string(RejectReason r) {
    switch (r) {
        case RejectReason::None:                 return "none";
        case RejectReason::Validation:           return "validation";
        case RejectReason::InsufficientLots:     return "insufficient_lots";
        case RejectReason::DuplicateTransaction: return "duplicate_transaction";
    }
    return "unknown";
}

/// Outcome of record_transaction as seen by the caller.
struct RecordResult {
    RecordStatus status = RecordStatus::Rejected;
    RejectReason reason = RejectReason::None;
    std::string text;

    std::optional<Transaction> transaction;
    std::optional<Position> position;
    std::vector<PositionLot> lots_touched;
    std::vector<SaleAllocation> allocations;

    bool accepted() const { return status != RecordStatus::Rejected; }

    double realized_pnl() const {
        double total = 0.0;
        for (const auto& a : allocations) total += a.realized_pnl;
        return total;
    }
};

}  // namespace lotledger::booking
