#include "booking/ingestion_gate.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace lotledger::booking {

IngestionGate::IngestionGate(storage::LedgerStore& store, const LotAllocationEngine& engine,
                             const PositionAggregator& aggregator,
                             core::ValidationConfig limits)
    : store_(store), engine_(engine), aggregator_(aggregator), limits_(limits) {}

RecordResult IngestionGate::submit(const TransactionRequest& request) {
    Transaction tx;
    try {
        tx = validate(request);
    } catch (const core::ValidationError& e) {
        return reject(RejectReason::Validation, e.what(), request);
    }

    if (tx.external_id) {
        if (auto stored = store_.find_by_external_id(tx.account_id, *tx.external_id)) {
            return replay(*stored, tx);
        }
    }

    try {
        return apply(std::move(tx));
    } catch (const core::InsufficientLotsError& e) {
        return reject(RejectReason::InsufficientLots, e.what(), request);
    } catch (const core::DuplicateTransactionError& e) {
        // Lost a race with another submission of the same external_id.
        if (auto stored = store_.find_by_external_id(request.account_id, *request.external_id)) {
            auto candidate = validate(request);
            return replay(*stored, candidate);
        }
        return reject(RejectReason::DuplicateTransaction, e.what(), request);
    } catch (const core::StorageError& e) {
        spdlog::error("[INGEST] Storage failure for {} {}: {}",
                      request.account_id, request.symbol, e.what());
        throw;
    }
}

Transaction IngestionGate::validate(const TransactionRequest& request) const {
    if (request.account_id.empty()) {
        throw core::ValidationError("account_id is required");
    }
    if (request.account_id.size() > limits_.max_account_id_length) {
        throw core::ValidationError("account_id longer than " +
                                    std::to_string(limits_.max_account_id_length) + " characters");
    }
    if (request.symbol.empty()) {
        throw core::ValidationError("symbol is required");
    }
    if (request.symbol.size() > limits_.max_symbol_length) {
        throw core::ValidationError("symbol longer than " +
                                    std::to_string(limits_.max_symbol_length) + " characters");
    }

    Transaction tx;
    try {
        tx.side = side_from_string(request.side);
    } catch (const std::invalid_argument&) {
        throw core::ValidationError("side must be BUY or SELL, got '" + request.side + "'");
    }

    // Negated comparisons so NaN is rejected too.
    if (!(request.quantity > 0.0)) {
        throw core::ValidationError("quantity must be positive");
    }
    if (request.quantity > limits_.max_quantity) {
        throw core::ValidationError("quantity exceeds " + std::to_string(limits_.max_quantity));
    }
    if (!(request.price > 0.0)) {
        throw core::ValidationError("price must be positive");
    }
    if (request.price > limits_.max_price) {
        throw core::ValidationError("price exceeds " + std::to_string(limits_.max_price));
    }
    if (!(request.commission >= 0.0)) {
        throw core::ValidationError("commission must not be negative");
    }
    if (request.commission > limits_.max_commission_rate * request.quantity * request.price) {
        throw core::ValidationError("commission exceeds " +
                                    std::to_string(limits_.max_commission_rate * 100.0) +
                                    "% of notional");
    }

    tx.transaction_date = core::parse_date_or_throw(request.transaction_date, "transaction_date");
    tx.account_id = request.account_id;
    if (request.external_id && !request.external_id->empty()) {
        tx.external_id = request.external_id;
    }
    tx.symbol = request.symbol;
    tx.quantity = request.quantity;
    tx.price = request.price;
    tx.commission = request.commission;
    tx.notes = request.notes;
    return tx;
}

RecordResult IngestionGate::apply(Transaction tx) {
    tx.id = store_.next_id(storage::IdKind::Transaction);
    tx.created_at = core::current_timestamp();
    tx.updated_at = tx.created_at;

    auto lots = store_.lots(tx.account_id, tx.symbol);
    auto previous = store_.position(tx.account_id, tx.symbol);

    AllocationOutcome outcome;
    if (tx.side == Side::Buy) {
        outcome.opened_lot = engine_.open_lot(tx, store_.next_id(storage::IdKind::Lot));
        tx.lot_id = outcome.opened_lot->id;
    } else {
        outcome = engine_.consume_lots(
            tx, lots, [this] { return store_.next_id(storage::IdKind::Allocation); });
    }

    core::Date last_date = tx.transaction_date;
    if (previous && previous->last_transaction_date > last_date) {
        last_date = previous->last_transaction_date;
    }

    storage::LedgerBatch batch;
    batch.position = aggregator_.aggregate(tx.account_id, tx.symbol,
                                           lots_after(std::move(lots), outcome), last_date);
    if (previous) batch.position.id = previous->id;
    batch.transaction = tx;
    batch.opened_lot = outcome.opened_lot;
    batch.updated_lots = outcome.updated_lots;
    batch.allocations = outcome.allocations;

    store_.commit(batch);

    RecordResult result;
    result.status = RecordStatus::Applied;
    result.transaction = tx;
    result.position = store_.position(tx.account_id, tx.symbol);
    if (outcome.opened_lot) {
        result.lots_touched.push_back(*outcome.opened_lot);
    } else {
        result.lots_touched = outcome.updated_lots;
    }
    result.allocations = outcome.allocations;

    spdlog::info("[INGEST] Applied {} {} | {} {} {} @ {} on {} | lots {} realized {:.2f}",
                 tx.id, tx.external_id.value_or("-"), tx.account_id, side_to_string(tx.side),
                 tx.symbol, tx.price, tx.transaction_date.to_string(),
                 result.lots_touched.size(), result.realized_pnl());
    return result;
}

RecordResult IngestionGate::replay(const Transaction& stored, const Transaction& candidate) const {
    if (!stored.same_payload(candidate)) {
        RecordResult result;
        result.status = RecordStatus::Rejected;
        result.reason = RejectReason::DuplicateTransaction;
        result.text = "external_id " + *candidate.external_id +
                      " already recorded for account " + candidate.account_id +
                      " with a different payload";
        result.transaction = stored;
        spdlog::warn("[INGEST] Rejected {}: {}", candidate.account_id, result.text);
        return result;
    }

    RecordResult result;
    result.status = RecordStatus::AlreadyApplied;
    result.transaction = stored;
    result.position = store_.position(stored.account_id, stored.symbol);

    if (stored.side == Side::Buy) {
        if (stored.lot_id) {
            if (auto lot = store_.find_lot(*stored.lot_id)) result.lots_touched.push_back(*lot);
        }
    } else {
        result.allocations = store_.allocations_for_sale(stored.id);
        for (const auto& alloc : result.allocations) {
            if (auto lot = store_.find_lot(alloc.lot_id)) result.lots_touched.push_back(*lot);
        }
    }

    spdlog::info("[INGEST] Replay of {} for {} ignored (transaction {})",
                 *stored.external_id, stored.account_id, stored.id);
    return result;
}

RecordResult IngestionGate::reject(RejectReason reason, const std::string& text,
                                   const TransactionRequest& request) const {
    RecordResult result;
    result.status = RecordStatus::Rejected;
    result.reason = reason;
    result.text = text;
    spdlog::warn("[INGEST] Rejected {} {} {} {} ({}): {}",
                 request.account_id, request.side, request.quantity, request.symbol,
                 reason_to_string(reason), text);
    return result;
}

}  // namespace lotledger::booking
