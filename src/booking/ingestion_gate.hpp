#pragma once

#include "booking/lot_allocation_engine.hpp"
#include "booking/position_aggregator.hpp"
#include "booking/record_result.hpp"
#include "core/config.hpp"
#include "storage/ledger_store.hpp"

namespace lotledger::booking {

/// Front door for trades: validates, deduplicates by external_id, runs the lot
/// engine and commits the result as one batch.
///
/// Business rejections come back as RecordResult::Rejected. StorageError is
/// not a rejection and propagates to the caller.
///
/// Callers must serialize submissions for the same (account, symbol).
class IngestionGate {
public:
    IngestionGate(storage::LedgerStore& store, const LotAllocationEngine& engine,
                  const PositionAggregator& aggregator,
                  core::ValidationConfig limits = {});

    RecordResult submit(const TransactionRequest& request);

    /// Build the transaction to store. Throws ValidationError. The id is left at 0.
    Transaction validate(const TransactionRequest& request) const;

private:
    RecordResult apply(Transaction tx);
    RecordResult replay(const Transaction& stored, const Transaction& candidate) const;
    RecordResult reject(RejectReason reason, const std::string& text,
                        const TransactionRequest& request) const;

    storage::LedgerStore& store_;
    const LotAllocationEngine& engine_;
    const PositionAggregator& aggregator_;
    core::ValidationConfig limits_;
};

}  // namespace lotledger::booking
