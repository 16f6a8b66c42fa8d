#pragma once

#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "core/date.hpp"

namespace lotledger::valuation {

struct PriceQuote {
    double price = 0.0;
    core::Date observed_date;
};

enum class MissingPriceStrategy { Backfill, Strict };

inline MissingPriceStrategy missing_price_strategy_from_string(const std::string& s) {
    if (s == "backfill") return MissingPriceStrategy::Backfill;
    if (s == "strict") return MissingPriceStrategy::Strict;
    throw std::invalid_argument("Unknown missing price strategy: " + s);
}

/// Close-price source. Implementations resolve prices outside the ledger;
/// the ledger only consumes the result.
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    /// Close price for `symbol` usable on `date`, or nullopt when none is known.
    virtual std::optional<PriceQuote> price_for(const std::string& symbol,
                                                const core::Date& date) const = 0;
};

/// Price table held in memory. With Backfill, a missing day resolves to the
/// latest earlier close and the quote carries that earlier date.
class StaticPriceFeed : public PriceFeed {
public:
    explicit StaticPriceFeed(MissingPriceStrategy strategy = MissingPriceStrategy::Backfill)
        : strategy_(strategy) {}

    void set_price(const std::string& symbol, const core::Date& date, double close) {
        closes_[symbol][date] = close;
    }

    std::optional<PriceQuote> price_for(const std::string& symbol,
                                        const core::Date& date) const override {
        auto sym_it = closes_.find(symbol);
        if (sym_it == closes_.end()) return std::nullopt;
        const auto& series = sym_it->second;

        auto exact = series.find(date);
        if (exact != series.end()) return PriceQuote{exact->second, date};
        if (strategy_ == MissingPriceStrategy::Strict) return std::nullopt;

        auto after = series.upper_bound(date);
        if (after == series.begin()) return std::nullopt;
        auto latest = std::prev(after);
        return PriceQuote{latest->second, latest->first};
    }

private:
    MissingPriceStrategy strategy_;
    std::unordered_map<std::string, std::map<core::Date, double>> closes_;
};

}  // namespace lotledger::valuation
