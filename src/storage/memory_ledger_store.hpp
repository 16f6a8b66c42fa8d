#pragma once

#include <map>
#include <mutex>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "storage/ledger_store.hpp"

namespace lotledger::storage {

/// In-process LedgerStore. A single mutex makes every commit and snapshot
/// upsert atomic with respect to readers.
class MemoryLedgerStore : public LedgerStore {
public:
    uint64_t next_id(IdKind kind) override;

    void commit(const LedgerBatch& batch) override;
    valuation::DailyPnLSnapshot upsert_snapshot(
        const valuation::DailyPnLSnapshot& snapshot) override;

    std::optional<booking::Transaction> find_transaction(uint64_t id) const override;
    std::optional<booking::Transaction> find_by_external_id(
        const std::string& account_id, const std::string& external_id) const override;
    std::vector<booking::Transaction> transactions(
        const std::string& account_id, const std::string& symbol = "") const override;

    std::vector<booking::PositionLot> lots(
        const std::string& account_id, const std::string& symbol) const override;
    std::optional<booking::PositionLot> find_lot(uint64_t id) const override;

    std::vector<booking::SaleAllocation> allocations_for_sale(
        uint64_t sale_transaction_id) const override;
    std::vector<booking::SaleAllocation> allocations(
        const std::string& account_id, const std::string& symbol) const override;

    std::optional<booking::Position> position(
        const std::string& account_id, const std::string& symbol) const override;
    std::vector<booking::Position> positions(const std::string& account_id) const override;

    std::optional<valuation::DailyPnLSnapshot> snapshot(
        const std::string& account_id, const std::string& symbol,
        const core::Date& valuation_date) const override;
    std::vector<valuation::DailyPnLSnapshot> snapshots(
        const std::string& account_id, const std::string& symbol,
        const core::Date& from, const core::Date& to) const override;

    size_t transaction_count() const;
    size_t lot_count() const;
    size_t allocation_count() const;
    size_t snapshot_count() const;

protected:
    using Key = std::pair<std::string, std::string>;  // (account, symbol)
    using SnapshotKey = std::tuple<std::string, std::string, core::Date>;

    // The helpers below expect mutex_ to be held.

    /// Check a batch against current state and fill in the position id.
    /// Throws without touching state.
    LedgerBatch prepare(const LedgerBatch& batch) const;

    /// Apply a prepared batch. Does not throw on a prepared batch.
    void apply(const LedgerBatch& batch);

    /// Fill in the snapshot id, reusing the existing row's id on overwrite.
    valuation::DailyPnLSnapshot prepare_snapshot(const valuation::DailyPnLSnapshot& snapshot) const;
    void apply_snapshot(const valuation::DailyPnLSnapshot& snapshot);

    mutable std::mutex mutex_;

private:
    uint64_t transaction_seq_ = 0;
    uint64_t lot_seq_ = 0;
    uint64_t allocation_seq_ = 0;
    uint64_t position_seq_ = 0;
    uint64_t snapshot_seq_ = 0;

    std::map<uint64_t, booking::Transaction> transactions_;
    std::map<uint64_t, booking::PositionLot> lots_;
    std::map<uint64_t, booking::SaleAllocation> allocations_;
    std::map<Key, booking::Position> positions_;
    std::map<SnapshotKey, valuation::DailyPnLSnapshot> snapshots_;

    // Indexes
    std::map<Key, std::vector<uint64_t>> lots_by_key_;
    std::unordered_map<uint64_t, std::vector<uint64_t>> allocations_by_sale_;
    std::unordered_map<uint64_t, std::vector<uint64_t>> allocations_by_lot_;
    std::unordered_map<std::string, std::unordered_map<std::string, uint64_t>> external_ids_;
};

}  // namespace lotledger::storage
