#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "booking/position.hpp"
#include "booking/position_lot.hpp"
#include "booking/sale_allocation.hpp"
#include "booking/transaction.hpp"
#include "core/date.hpp"
#include "valuation/daily_pnl.hpp"

namespace lotledger::storage {

enum class IdKind { Transaction, Lot, Allocation };

/// Everything one accepted transaction changes. Committed all-or-nothing.
struct LedgerBatch {
    booking::Transaction transaction;
    std::optional<booking::PositionLot> opened_lot;     // BUY
    std::vector<booking::PositionLot> updated_lots;     // SELL: lots after consumption
    std::vector<booking::SaleAllocation> allocations;   // SELL
    booking::Position position;
};

/// Persistence collaborator. Records live in append-only arenas keyed by
/// surrogate id; relationships are stored ids resolved through lookups.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    /// Reserve a surrogate id. Ids are never reused; rejected work leaves gaps.
    virtual uint64_t next_id(IdKind kind) = 0;

    /// Apply a batch atomically. Throws DuplicateTransactionError when the
    /// batch's external_id is already taken for the account, StorageError on
    /// any other failure. Nothing is applied when it throws.
    virtual void commit(const LedgerBatch& batch) = 0;

    /// Insert or replace the snapshot for (account, symbol, valuation_date).
    /// Returns the stored row with its id.
    virtual valuation::DailyPnLSnapshot upsert_snapshot(
        const valuation::DailyPnLSnapshot& snapshot) = 0;

    virtual std::optional<booking::Transaction> find_transaction(uint64_t id) const = 0;
    virtual std::optional<booking::Transaction> find_by_external_id(
        const std::string& account_id, const std::string& external_id) const = 0;

    /// Transactions for an account in id order. Empty symbol means all symbols.
    virtual std::vector<booking::Transaction> transactions(
        const std::string& account_id, const std::string& symbol = "") const = 0;

    /// All lots of (account, symbol), closed ones included, in creation order.
    virtual std::vector<booking::PositionLot> lots(
        const std::string& account_id, const std::string& symbol) const = 0;
    virtual std::optional<booking::PositionLot> find_lot(uint64_t id) const = 0;

    virtual std::vector<booking::SaleAllocation> allocations_for_sale(
        uint64_t sale_transaction_id) const = 0;
    virtual std::vector<booking::SaleAllocation> allocations(
        const std::string& account_id, const std::string& symbol) const = 0;

    virtual std::optional<booking::Position> position(
        const std::string& account_id, const std::string& symbol) const = 0;
    virtual std::vector<booking::Position> positions(const std::string& account_id) const = 0;

    virtual std::optional<valuation::DailyPnLSnapshot> snapshot(
        const std::string& account_id, const std::string& symbol,
        const core::Date& valuation_date) const = 0;

    /// Snapshots with from <= valuation_date <= to, ordered by symbol then date.
    /// Empty symbol means all symbols.
    virtual std::vector<valuation::DailyPnLSnapshot> snapshots(
        const std::string& account_id, const std::string& symbol,
        const core::Date& from, const core::Date& to) const = 0;
};

}  // namespace lotledger::storage
