#include "service/ledger_service.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

#include "core/metrics.hpp"

namespace lotledger::service {

namespace {
constexpr double kConsistencyTolerance = 1e-4;
}

LedgerService::LedgerService(storage::LedgerStore& store, const core::Config& cfg)
    : store_(store),
      engine_(booking::make_lot_policy(cfg.ledger.cost_basis_method),
              cfg.ledger.quantity_epsilon),
      aggregator_(cfg.ledger.quantity_epsilon),
      gate_(store_, engine_, aggregator_, cfg.validation),
      snapshotter_(store_),
      closes_(valuation::missing_price_strategy_from_string(
          cfg.valuation.missing_price_strategy)) {
    spdlog::info("Ledger service ready (cost basis: {})", engine_.policy().name());
}

std::mutex& LedgerService::lock_for(const std::string& account_id, const std::string& symbol) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    return key_locks_[{account_id, symbol}];
}

booking::RecordResult LedgerService::record_transaction(
    const booking::TransactionRequest& request) {
    auto& metrics = core::Metrics::instance();
    metrics.transactions_received++;
    core::ScopedTimer timer;

    std::lock_guard<std::mutex> lock(lock_for(request.account_id, request.symbol));
    auto result = gate_.submit(request);

    switch (result.status) {
        case booking::RecordStatus::Applied:
            metrics.transactions_applied++;
            metrics.add_realized_pnl(result.realized_pnl());
            break;
        case booking::RecordStatus::AlreadyApplied:
            metrics.transactions_replayed++;
            break;
        case booking::RecordStatus::Rejected:
            metrics.transactions_rejected++;
            if (result.reason == booking::RejectReason::InsufficientLots) {
                metrics.insufficient_lot_rejects++;
            }
            break;
    }
    return result;
}

valuation::DailyPnLSnapshot LedgerService::snapshot_valuation(
    const std::string& account_id, const std::string& symbol,
    const core::Date& valuation_date, const valuation::PriceQuote& quote) {
    std::lock_guard<std::mutex> lock(lock_for(account_id, symbol));
    return snapshotter_.snapshot(account_id, symbol, valuation_date, quote);
}

std::optional<valuation::DailyPnLSnapshot> LedgerService::snapshot_from_feed(
    const std::string& account_id, const std::string& symbol,
    const core::Date& valuation_date, const valuation::PriceFeed& feed) {
    std::lock_guard<std::mutex> lock(lock_for(account_id, symbol));
    return snapshotter_.snapshot_from_feed(account_id, symbol, valuation_date, feed);
}

std::vector<valuation::DailyPnLSnapshot> LedgerService::snapshot_range(
    const std::string& account_id, const std::string& symbol,
    const core::Date& from, const core::Date& to, const valuation::PriceFeed& feed) {
    std::lock_guard<std::mutex> lock(lock_for(account_id, symbol));
    return snapshotter_.snapshot_range(account_id, symbol, from, to, feed);
}

void LedgerService::record_close(const std::string& symbol, const core::Date& date,
                                 double price) {
    std::lock_guard<std::mutex> lock(closes_mutex_);
    closes_.set_price(symbol, date, price);
}

std::optional<valuation::DailyPnLSnapshot> LedgerService::snapshot_from_closes(
    const std::string& account_id, const std::string& symbol,
    const core::Date& valuation_date) {
    std::optional<valuation::PriceQuote> quote;
    {
        std::lock_guard<std::mutex> lock(closes_mutex_);
        quote = closes_.price_for(symbol, valuation_date);
    }
    if (!quote) {
        spdlog::warn("[VALUE] No recorded close for {} on {}", symbol, valuation_date.to_string());
        return std::nullopt;
    }
    return snapshot_valuation(account_id, symbol, valuation_date, *quote);
}

std::optional<booking::Position> LedgerService::get_position(const std::string& account_id,
                                                             const std::string& symbol) const {
    return store_.position(account_id, symbol);
}

std::vector<booking::Position> LedgerService::get_positions(const std::string& account_id,
                                                            bool active_only) const {
    auto all = store_.positions(account_id);
    if (!active_only) return all;

    std::vector<booking::Position> active;
    for (auto& pos : all) {
        if (pos.is_active) active.push_back(std::move(pos));
    }
    return active;
}

std::vector<booking::PositionLot> LedgerService::get_lots(const std::string& account_id,
                                                          const std::string& symbol,
                                                          bool include_closed) const {
    auto all = store_.lots(account_id, symbol);
    if (include_closed) return all;

    std::vector<booking::PositionLot> open;
    for (auto& lot : all) {
        if (!lot.is_closed) open.push_back(std::move(lot));
    }
    return open;
}

std::vector<booking::SaleAllocation> LedgerService::get_allocations(
    uint64_t sale_transaction_id) const {
    return store_.allocations_for_sale(sale_transaction_id);
}

std::vector<booking::Transaction> LedgerService::get_transactions(
    const std::string& account_id, const std::string& symbol) const {
    return store_.transactions(account_id, symbol);
}

std::vector<valuation::DailyPnLSnapshot> LedgerService::get_snapshots(
    const std::string& account_id, const std::string& symbol,
    const core::Date& from, const core::Date& to) const {
    return store_.snapshots(account_id, symbol, from, to);
}

valuation::PortfolioSummary LedgerService::summarize_portfolio(
    const std::string& account_id, const core::Date& valuation_date) const {
    return snapshotter_.summarize(account_id, valuation_date);
}

ConsistencyReport LedgerService::check_consistency(const std::string& account_id,
                                                    const std::string& symbol) {
    std::vector<std::string> symbols;
    if (!symbol.empty()) {
        symbols.push_back(symbol);
    } else {
        for (const auto& pos : store_.positions(account_id)) symbols.push_back(pos.symbol);
    }

    ConsistencyReport report;
    report.account_id = account_id;
    for (const auto& sym : symbols) {
        std::lock_guard<std::mutex> lock(lock_for(account_id, sym));
        report.symbols.push_back(check_symbol(account_id, sym, report.issues));
    }

    if (report.consistent()) {
        spdlog::info("[POSITION] {} consistent across {} symbol(s)", account_id, report.symbols.size());
    } else {
        for (const auto& issue : report.issues) {
            spdlog::warn("[POSITION] {} {} {}: {}", account_id, issue.symbol,
                         issue_kind_to_string(issue.kind), issue.description);
        }
    }
    return report;
}

SymbolConsistency LedgerService::check_symbol(const std::string& account_id,
                                              const std::string& symbol,
                                              std::vector<ConsistencyIssue>& issues) const {
    SymbolConsistency stats;
    stats.symbol = symbol;

    auto transactions = store_.transactions(account_id, symbol);
    for (const auto& tx : transactions) {
        if (tx.side == booking::Side::Buy) {
            stats.buy_transactions++;
            continue;
        }
        stats.sell_transactions++;

        double allocated = 0.0;
        for (const auto& alloc : store_.allocations_for_sale(tx.id)) allocated += alloc.quantity_sold;
        if (std::fabs(allocated - tx.quantity) > kConsistencyTolerance) {
            issues.push_back({IssueKind::AllocationMismatch, symbol, tx.id, tx.quantity, allocated,
                              "SELL " + std::to_string(tx.id) + " of " + std::to_string(tx.quantity) +
                                  " has " + std::to_string(allocated) + " allocated"});
        }
    }

    auto lots = store_.lots(account_id, symbol);
    stats.lots = lots.size();
    for (const auto& lot : lots) {
        if (lot.is_closed) {
            stats.closed_lots++;
        } else {
            stats.open_lots++;
            stats.open_quantity += lot.remaining_quantity;
        }
    }
    if (stats.lots != stats.buy_transactions) {
        issues.push_back({IssueKind::LotCountMismatch, symbol, 0,
                          static_cast<double>(stats.buy_transactions), static_cast<double>(stats.lots),
                          std::to_string(stats.buy_transactions) + " BUY transactions but " +
                              std::to_string(stats.lots) + " lots"});
    }

    auto position = store_.position(account_id, symbol);
    if (!position) {
        if (!transactions.empty()) {
            issues.push_back({IssueKind::MissingPosition, symbol, 0, stats.open_quantity, 0.0,
                              "transactions stored but no position"});
        }
        return stats;
    }

    stats.position_quantity = position->quantity;
    if (std::fabs(stats.open_quantity - position->quantity) > kConsistencyTolerance) {
        issues.push_back({IssueKind::PositionQuantityMismatch, symbol, 0, stats.open_quantity,
                          position->quantity,
                          "open lots hold " + std::to_string(stats.open_quantity) +
                              " but position shows " + std::to_string(position->quantity)});
    }
    return stats;
}

}  // namespace lotledger::service
