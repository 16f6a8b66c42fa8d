#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lotledger::service {

enum class IssueKind {
    LotCountMismatch,        // BUY transactions vs lots
    AllocationMismatch,      // SELL quantity vs allocated slices
    PositionQuantityMismatch,
    MissingPosition,
};

inline std::string issue_kind_to_string(IssueKind k) {
    switch (k) {
        case IssueKind::LotCountMismatch:         return "LOT_COUNT_MISMATCH";
        case IssueKind::AllocationMismatch:       return "ALLOCATION_MISMATCH";
        case IssueKind::PositionQuantityMismatch: return "POSITION_QUANTITY_MISMATCH";
        case IssueKind::MissingPosition:          return "MISSING_POSITION";
    }
    return "UNKNOWN";
}

struct ConsistencyIssue {
    IssueKind kind = IssueKind::LotCountMismatch;
    std::string symbol;
    uint64_t transaction_id = 0;  // set for AllocationMismatch
    double expected = 0.0;
    double actual = 0.0;
    std::string description;
};

/// Per-symbol counts gathered while checking.
struct SymbolConsistency {
    std::string symbol;
    size_t buy_transactions = 0;
    size_t sell_transactions = 0;
    size_t lots = 0;
    size_t open_lots = 0;
    size_t closed_lots = 0;
    double open_quantity = 0.0;
    double position_quantity = 0.0;
};

struct ConsistencyReport {
    std::string account_id;
    std::vector<SymbolConsistency> symbols;
    std::vector<ConsistencyIssue> issues;

    bool consistent() const { return issues.empty(); }
};

}  // namespace lotledger::service
