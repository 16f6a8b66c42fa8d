#pragma once

#include <optional>
#include <string>
#include <vector>

#include "booking/position.hpp"
#include "storage/ledger_store.hpp"
#include "valuation/daily_pnl.hpp"
#include "valuation/price_feed.hpp"

namespace lotledger::valuation {

/// Totals over one account's snapshots for one date.
struct PortfolioSummary {
    std::string account_id;
    core::Date valuation_date;
    size_t symbol_count = 0;
    size_t stale_price_count = 0;
    double market_value = 0.0;
    double total_cost = 0.0;
    double unrealized_pnl = 0.0;
    double unrealized_pnl_pct = 0.0;
    double realized_pnl = 0.0;
};

/// Values committed positions against a caller-supplied price and upserts a
/// DailyPnLSnapshot per (account, symbol, valuation_date).
class ValuationSnapshotter {
public:
    explicit ValuationSnapshotter(storage::LedgerStore& store);

    /// Compute and store. Throws ValidationError for a non-positive price, a
    /// price observed after the valuation date, an unknown position, or a
    /// valuation date before the position's first buy.
    DailyPnLSnapshot snapshot(const std::string& account_id, const std::string& symbol,
                              const core::Date& valuation_date, const PriceQuote& quote);

    /// Same, with the price taken from `feed`. nullopt when the feed has no price.
    std::optional<DailyPnLSnapshot> snapshot_from_feed(const std::string& account_id,
                                                       const std::string& symbol,
                                                       const core::Date& valuation_date,
                                                       const PriceFeed& feed);

    /// One snapshot per calendar day in [from, to]; days without a price or
    /// before the first buy are skipped.
    std::vector<DailyPnLSnapshot> snapshot_range(const std::string& account_id,
                                                 const std::string& symbol,
                                                 const core::Date& from, const core::Date& to,
                                                 const PriceFeed& feed);

    /// Sum of realized P&L over sales dated on or before `as_of`.
    double realized_pnl_to_date(const std::string& account_id, const std::string& symbol,
                                const core::Date& as_of) const;

    PortfolioSummary summarize(const std::string& account_id,
                               const core::Date& valuation_date) const;

    /// Pure valuation arithmetic. No id, nothing stored.
    static DailyPnLSnapshot compute(const booking::Position& position,
                                    const core::Date& valuation_date,
                                    const PriceQuote& quote, double realized_pnl);

private:
    storage::LedgerStore& store_;
};

}  // namespace lotledger::valuation
