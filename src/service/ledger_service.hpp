#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "booking/ingestion_gate.hpp"
#include "booking/lot_allocation_engine.hpp"
#include "booking/position_aggregator.hpp"
#include "booking/record_result.hpp"
#include "core/config.hpp"
#include "service/consistency_report.hpp"
#include "storage/ledger_store.hpp"
#include "valuation/price_feed.hpp"
#include "valuation/valuation_snapshotter.hpp"

namespace lotledger::service {

/// The ledger's public surface. Serializes work per (account, symbol), so
/// callers on different threads may submit freely; different pairs proceed
/// in parallel.
class LedgerService {
public:
    explicit LedgerService(storage::LedgerStore& store,
                           const core::Config& cfg = core::Config::defaults());

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    /// Validate, deduplicate and apply one trade. Business rejections are in
    /// the result; StorageError propagates.
    booking::RecordResult record_transaction(const booking::TransactionRequest& request);

    valuation::DailyPnLSnapshot snapshot_valuation(const std::string& account_id,
                                                   const std::string& symbol,
                                                   const core::Date& valuation_date,
                                                   const valuation::PriceQuote& quote);

    std::optional<valuation::DailyPnLSnapshot> snapshot_from_feed(
        const std::string& account_id, const std::string& symbol,
        const core::Date& valuation_date, const valuation::PriceFeed& feed);

    std::vector<valuation::DailyPnLSnapshot> snapshot_range(
        const std::string& account_id, const std::string& symbol,
        const core::Date& from, const core::Date& to, const valuation::PriceFeed& feed);

    /// Remember a close price for later snapshot_from_closes calls.
    void record_close(const std::string& symbol, const core::Date& date, double price);

    /// Snapshot priced from the recorded closes, resolved with the configured
    /// missing-price strategy. nullopt when no close applies.
    std::optional<valuation::DailyPnLSnapshot> snapshot_from_closes(
        const std::string& account_id, const std::string& symbol,
        const core::Date& valuation_date);

    std::optional<booking::Position> get_position(const std::string& account_id,
                                                  const std::string& symbol) const;
    std::vector<booking::Position> get_positions(const std::string& account_id,
                                                 bool active_only = false) const;
    std::vector<booking::PositionLot> get_lots(const std::string& account_id,
                                               const std::string& symbol,
                                               bool include_closed = false) const;
    std::vector<booking::SaleAllocation> get_allocations(uint64_t sale_transaction_id) const;
    std::vector<booking::Transaction> get_transactions(const std::string& account_id,
                                                       const std::string& symbol = "") const;
    std::vector<valuation::DailyPnLSnapshot> get_snapshots(const std::string& account_id,
                                                           const std::string& symbol,
                                                           const core::Date& from,
                                                           const core::Date& to) const;

    valuation::PortfolioSummary summarize_portfolio(const std::string& account_id,
                                                    const core::Date& valuation_date) const;

    /// Cross-check stored records: one lot per BUY, each SELL fully allocated,
    /// open lot quantity equal to the position. An empty symbol checks every
    /// position of the account.
    ConsistencyReport check_consistency(const std::string& account_id,
                                        const std::string& symbol = "");

    const booking::LotSelectionPolicy& lot_policy() const { return engine_.policy(); }

private:
    std::mutex& lock_for(const std::string& account_id, const std::string& symbol);
    SymbolConsistency check_symbol(const std::string& account_id, const std::string& symbol,
                                   std::vector<ConsistencyIssue>& issues) const;

    storage::LedgerStore& store_;
    booking::LotAllocationEngine engine_;
    booking::PositionAggregator aggregator_;
    booking::IngestionGate gate_;
    valuation::ValuationSnapshotter snapshotter_;

    std::mutex closes_mutex_;
    valuation::StaticPriceFeed closes_;

    std::mutex locks_mutex_;
    std::map<std::pair<std::string, std::string>, std::mutex> key_locks_;
};

}  // namespace lotledger::service
