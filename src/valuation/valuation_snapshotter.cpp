#include "valuation/valuation_snapshotter.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

#include "core/errors.hpp"
#include "core/metrics.hpp"

namespace lotledger::valuation {

ValuationSnapshotter::ValuationSnapshotter(storage::LedgerStore& store) : store_(store) {}

DailyPnLSnapshot ValuationSnapshotter::compute(const booking::Position& position,
                                               const core::Date& valuation_date,
                                               const PriceQuote& quote, double realized_pnl) {
    DailyPnLSnapshot snap;
    snap.account_id = position.account_id;
    snap.symbol = position.symbol;
    snap.valuation_date = valuation_date;
    snap.market_price = quote.price;
    snap.price_date = quote.observed_date;
    snap.is_stale_price = quote.observed_date != valuation_date;
    snap.realized_pnl = realized_pnl;

    if (position.is_active && position.quantity > 0.0) {
        snap.quantity = position.quantity;
        snap.avg_cost = position.avg_cost;
        snap.total_cost = position.quantity * position.avg_cost;
        snap.market_value = position.quantity * quote.price;
        snap.unrealized_pnl = snap.market_value - snap.total_cost;
    }

    // Flat or zero-cost positions report 0% rather than dividing by zero.
    if (snap.total_cost > 0.0) {
        snap.unrealized_pnl_pct = snap.unrealized_pnl / snap.total_cost * 100.0;
        snap.realized_pnl_pct = snap.realized_pnl / snap.total_cost * 100.0;
    }
    return snap;
}

double ValuationSnapshotter::realized_pnl_to_date(const std::string& account_id,
                                                  const std::string& symbol,
                                                  const core::Date& as_of) const {
    std::unordered_map<uint64_t, bool> sale_counts;  // sale id -> dated on or before as_of
    double total = 0.0;
    for (const auto& alloc : store_.allocations(account_id, symbol)) {
        auto it = sale_counts.find(alloc.sale_transaction_id);
        if (it == sale_counts.end()) {
            auto sale = store_.find_transaction(alloc.sale_transaction_id);
            if (!sale) {
                throw core::StorageError("Allocation " + std::to_string(alloc.id) +
                                         " references missing sale " +
                                         std::to_string(alloc.sale_transaction_id));
            }
            it = sale_counts.emplace(alloc.sale_transaction_id,
                                     sale->transaction_date <= as_of).first;
        }
        if (it->second) total += alloc.realized_pnl;
    }
    return total;
}

DailyPnLSnapshot ValuationSnapshotter::snapshot(const std::string& account_id,
                                                const std::string& symbol,
                                                const core::Date& valuation_date,
                                                const PriceQuote& quote) {
    if (!(quote.price > 0.0)) {
        throw core::ValidationError("market price must be positive");
    }
    if (quote.observed_date > valuation_date) {
        throw core::ValidationError("price date " + quote.observed_date.to_string() +
                                    " is after valuation date " + valuation_date.to_string());
    }

    auto position = store_.position(account_id, symbol);
    if (!position) {
        throw core::ValidationError("No position for " + account_id + " " + symbol);
    }
    if (valuation_date < position->first_buy_date) {
        throw core::ValidationError("valuation date " + valuation_date.to_string() +
                                    " is before the first buy of " + symbol + " on " +
                                    position->first_buy_date.to_string());
    }

    auto snap = compute(*position, valuation_date, quote,
                        realized_pnl_to_date(account_id, symbol, valuation_date));
    auto stored = store_.upsert_snapshot(snap);

    auto& metrics = core::Metrics::instance();
    metrics.snapshots_written++;
    if (stored.is_stale_price) {
        metrics.stale_snapshots++;
        spdlog::warn("[VALUE] Stale price for {} {} on {}: using close of {}",
                     account_id, symbol, valuation_date.to_string(),
                     stored.price_date.to_string());
    }

    spdlog::info("[VALUE] {} {} {} | qty {} @ {} value {:.2f} unrealized {:.2f} ({:.2f}%) realized {:.2f}",
                 account_id, symbol, valuation_date.to_string(), stored.quantity,
                 stored.market_price, stored.market_value, stored.unrealized_pnl,
                 stored.unrealized_pnl_pct, stored.realized_pnl);
    return stored;
}

std::optional<DailyPnLSnapshot> ValuationSnapshotter::snapshot_from_feed(
    const std::string& account_id, const std::string& symbol,
    const core::Date& valuation_date, const PriceFeed& feed) {
    auto quote = feed.price_for(symbol, valuation_date);
    if (!quote) {
        spdlog::warn("[VALUE] No price for {} on {}", symbol, valuation_date.to_string());
        return std::nullopt;
    }
    return snapshot(account_id, symbol, valuation_date, *quote);
}

std::vector<DailyPnLSnapshot> ValuationSnapshotter::snapshot_range(
    const std::string& account_id, const std::string& symbol,
    const core::Date& from, const core::Date& to, const PriceFeed& feed) {
    if (to < from) {
        throw core::ValidationError("range end " + to.to_string() +
                                    " is before start " + from.to_string());
    }

    auto position = store_.position(account_id, symbol);
    if (!position) {
        throw core::ValidationError("No position for " + account_id + " " + symbol);
    }

    // Nothing was held before the first purchase.
    auto start = from < position->first_buy_date ? position->first_buy_date : from;

    std::vector<DailyPnLSnapshot> result;
    for (auto day = start; day <= to; day = day.next_day()) {
        if (auto snap = snapshot_from_feed(account_id, symbol, day, feed)) {
            result.push_back(std::move(*snap));
        }
    }
    return result;
}

PortfolioSummary ValuationSnapshotter::summarize(const std::string& account_id,
                                                 const core::Date& valuation_date) const {
    PortfolioSummary summary;
    summary.account_id = account_id;
    summary.valuation_date = valuation_date;

    for (const auto& snap : store_.snapshots(account_id, "", valuation_date, valuation_date)) {
        ++summary.symbol_count;
        if (snap.is_stale_price) ++summary.stale_price_count;
        summary.market_value += snap.market_value;
        summary.total_cost += snap.total_cost;
        summary.unrealized_pnl += snap.unrealized_pnl;
        summary.realized_pnl += snap.realized_pnl;
    }
    if (summary.total_cost > 0.0) {
        summary.unrealized_pnl_pct = summary.unrealized_pnl / summary.total_cost * 100.0;
    }
    return summary;
}

}  // namespace lotledger::valuation
