#pragma once

#include <string>

namespace lotledger::core {

struct ServerConfig {
    std::string bind_address = "tcp://*:5555";
    int poll_timeout_ms = 100;
};

struct LedgerConfig {
    std::string cost_basis_method = "fifo";
    double quantity_epsilon = 1e-9;
    std::string journal_path;  // empty = in-memory only
};

struct ValidationConfig {
    size_t max_account_id_length = 100;
    size_t max_symbol_length = 20;
    double max_quantity = 10'000'000.0;
    double max_price = 1'000'000.0;
    double max_commission_rate = 0.1;  // fraction of quantity * price
};

struct ValuationConfig {
    std::string missing_price_strategy = "backfill";  // "backfill" | "strict"
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/lotledger.log";
};

struct MetricsConfig {
    int report_interval_s = 60;
    bool enabled = true;
};

struct Config {
    ServerConfig server;
    LedgerConfig ledger;
    ValidationConfig validation;
    ValuationConfig valuation;
    LoggingConfig logging;
    MetricsConfig metrics;

    static Config load(const std::string& path);
    static Config load_with_overrides(const std::string& path, int argc, char* argv[]);
    static Config defaults();
};

}  // namespace lotledger::core
