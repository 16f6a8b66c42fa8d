#include "storage/memory_ledger_store.hpp"

#include <algorithm>

#include "core/errors.hpp"

namespace lotledger::storage {

using booking::PositionLot;
using booking::SaleAllocation;
using booking::Transaction;
using valuation::DailyPnLSnapshot;

uint64_t MemoryLedgerStore::next_id(IdKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (kind) {
        case IdKind::Transaction: return ++transaction_seq_;
        case IdKind::Lot:         return ++lot_seq_;
        case IdKind::Allocation:  return ++allocation_seq_;
    }
    throw core::StorageError("Unknown id kind");
}

void MemoryLedgerStore::commit(const LedgerBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(prepare(batch));
}

DailyPnLSnapshot MemoryLedgerStore::upsert_snapshot(const DailyPnLSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = prepare_snapshot(snapshot);
    apply_snapshot(stored);
    return stored;
}

LedgerBatch MemoryLedgerStore::prepare(const LedgerBatch& batch) const {
    const auto& tx = batch.transaction;

    if (tx.id == 0) {
        throw core::StorageError("Transaction has no id");
    }
    if (transactions_.count(tx.id)) {
        throw core::StorageError("Transaction id already stored: " + std::to_string(tx.id));
    }
    if (tx.external_id) {
        auto acct_it = external_ids_.find(tx.account_id);
        if (acct_it != external_ids_.end() && acct_it->second.count(*tx.external_id)) {
            throw core::DuplicateTransactionError(
                "external_id " + *tx.external_id + " already recorded for account " + tx.account_id);
        }
    }

    if (batch.opened_lot) {
        const auto& lot = *batch.opened_lot;
        if (lot.id == 0 || lots_.count(lot.id)) {
            throw core::StorageError("Invalid or duplicate lot id: " + std::to_string(lot.id));
        }
        if (lot.transaction_id != tx.id) {
            throw core::StorageError("Lot " + std::to_string(lot.id) +
                                     " does not belong to transaction " + std::to_string(tx.id));
        }
    }

    for (const auto& updated : batch.updated_lots) {
        auto it = lots_.find(updated.id);
        if (it == lots_.end()) {
            throw core::StorageError("Unknown lot: " + std::to_string(updated.id));
        }
        const auto& current = it->second;
        if (current.account_id != tx.account_id || current.symbol != tx.symbol) {
            throw core::StorageError("Lot " + std::to_string(updated.id) +
                                     " belongs to another position");
        }
        if (current.is_closed) {
            throw core::StorageError("Lot " + std::to_string(updated.id) + " is already closed");
        }
        if (updated.remaining_quantity > current.remaining_quantity ||
            updated.remaining_quantity < 0.0) {
            throw core::StorageError("Lot " + std::to_string(updated.id) +
                                     " remaining quantity may only decrease");
        }
    }

    for (const auto& alloc : batch.allocations) {
        if (alloc.id == 0 || allocations_.count(alloc.id)) {
            throw core::StorageError("Invalid or duplicate allocation id: " +
                                     std::to_string(alloc.id));
        }
        if (alloc.sale_transaction_id != tx.id || !lots_.count(alloc.lot_id)) {
            throw core::StorageError("Allocation " + std::to_string(alloc.id) +
                                     " references an unknown lot or another sale");
        }
    }

    LedgerBatch prepared = batch;
    auto pos_it = positions_.find({tx.account_id, tx.symbol});
    if (pos_it != positions_.end()) {
        prepared.position.id = pos_it->second.id;
    } else if (prepared.position.id == 0) {
        prepared.position.id = position_seq_ + 1;
    }
    return prepared;
}

void MemoryLedgerStore::apply(const LedgerBatch& batch) {
    const auto& tx = batch.transaction;
    Key key{tx.account_id, tx.symbol};

    transactions_[tx.id] = tx;
    transaction_seq_ = std::max(transaction_seq_, tx.id);
    if (tx.external_id) {
        external_ids_[tx.account_id][*tx.external_id] = tx.id;
    }

    if (batch.opened_lot) {
        const auto& lot = *batch.opened_lot;
        lots_[lot.id] = lot;
        lots_by_key_[key].push_back(lot.id);
        lot_seq_ = std::max(lot_seq_, lot.id);
    }

    for (const auto& updated : batch.updated_lots) {
        auto& lot = lots_[updated.id];
        lot.remaining_quantity = updated.remaining_quantity;
        lot.is_closed = updated.is_closed;
    }

    for (const auto& alloc : batch.allocations) {
        allocations_[alloc.id] = alloc;
        allocations_by_sale_[alloc.sale_transaction_id].push_back(alloc.id);
        allocations_by_lot_[alloc.lot_id].push_back(alloc.id);
        allocation_seq_ = std::max(allocation_seq_, alloc.id);
    }

    positions_[key] = batch.position;
    position_seq_ = std::max(position_seq_, batch.position.id);
}

DailyPnLSnapshot MemoryLedgerStore::prepare_snapshot(const DailyPnLSnapshot& snapshot) const {
    DailyPnLSnapshot stored = snapshot;
    auto it = snapshots_.find({snapshot.account_id, snapshot.symbol, snapshot.valuation_date});
    if (it != snapshots_.end()) {
        stored.id = it->second.id;
    } else if (stored.id == 0) {
        stored.id = snapshot_seq_ + 1;
    }
    return stored;
}

void MemoryLedgerStore::apply_snapshot(const DailyPnLSnapshot& snapshot) {
    snapshots_[{snapshot.account_id, snapshot.symbol, snapshot.valuation_date}] = snapshot;
    snapshot_seq_ = std::max(snapshot_seq_, snapshot.id);
}

std::optional<Transaction> MemoryLedgerStore::find_transaction(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(id);
    if (it == transactions_.end()) return std::nullopt;
    return it->second;
}

std::optional<Transaction> MemoryLedgerStore::find_by_external_id(
    const std::string& account_id, const std::string& external_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto acct_it = external_ids_.find(account_id);
    if (acct_it == external_ids_.end()) return std::nullopt;
    auto ext_it = acct_it->second.find(external_id);
    if (ext_it == acct_it->second.end()) return std::nullopt;
    return transactions_.at(ext_it->second);
}

std::vector<Transaction> MemoryLedgerStore::transactions(
    const std::string& account_id, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> result;
    for (const auto& [_, tx] : transactions_) {
        if (tx.account_id != account_id) continue;
        if (!symbol.empty() && tx.symbol != symbol) continue;
        result.push_back(tx);
    }
    return result;
}

std::vector<PositionLot> MemoryLedgerStore::lots(
    const std::string& account_id, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PositionLot> result;
    auto it = lots_by_key_.find({account_id, symbol});
    if (it == lots_by_key_.end()) return result;

    result.reserve(it->second.size());
    for (auto lot_id : it->second) {
        result.push_back(lots_.at(lot_id));
    }
    return result;
}

std::optional<PositionLot> MemoryLedgerStore::find_lot(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lots_.find(id);
    if (it == lots_.end()) return std::nullopt;
    return it->second;
}

std::vector<SaleAllocation> MemoryLedgerStore::allocations_for_sale(
    uint64_t sale_transaction_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SaleAllocation> result;
    auto it = allocations_by_sale_.find(sale_transaction_id);
    if (it == allocations_by_sale_.end()) return result;

    for (auto alloc_id : it->second) {
        result.push_back(allocations_.at(alloc_id));
    }
    return result;
}

std::vector<SaleAllocation> MemoryLedgerStore::allocations(
    const std::string& account_id, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SaleAllocation> result;
    auto key_it = lots_by_key_.find({account_id, symbol});
    if (key_it == lots_by_key_.end()) return result;

    for (auto lot_id : key_it->second) {
        auto alloc_it = allocations_by_lot_.find(lot_id);
        if (alloc_it == allocations_by_lot_.end()) continue;
        for (auto alloc_id : alloc_it->second) {
            result.push_back(allocations_.at(alloc_id));
        }
    }
    std::sort(result.begin(), result.end(),
              [](const SaleAllocation& a, const SaleAllocation& b) { return a.id < b.id; });
    return result;
}

std::optional<booking::Position> MemoryLedgerStore::position(
    const std::string& account_id, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find({account_id, symbol});
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<booking::Position> MemoryLedgerStore::positions(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<booking::Position> result;
    for (auto it = positions_.lower_bound({account_id, ""});
         it != positions_.end() && it->first.first == account_id; ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::optional<DailyPnLSnapshot> MemoryLedgerStore::snapshot(
    const std::string& account_id, const std::string& symbol,
    const core::Date& valuation_date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find({account_id, symbol, valuation_date});
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

std::vector<DailyPnLSnapshot> MemoryLedgerStore::snapshots(
    const std::string& account_id, const std::string& symbol,
    const core::Date& from, const core::Date& to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyPnLSnapshot> result;
    for (const auto& [key, snap] : snapshots_) {
        if (std::get<0>(key) != account_id) continue;
        if (!symbol.empty() && std::get<1>(key) != symbol) continue;
        const auto& date = std::get<2>(key);
        if (date < from || date > to) continue;
        result.push_back(snap);
    }
    return result;
}

size_t MemoryLedgerStore::transaction_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_.size();
}

size_t MemoryLedgerStore::lot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lots_.size();
}

size_t MemoryLedgerStore::allocation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_.size();
}

size_t MemoryLedgerStore::snapshot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

}  // namespace lotledger::storage
