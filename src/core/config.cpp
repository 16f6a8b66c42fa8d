#include "core/config.hpp"

#include <toml++/toml.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace lotledger::core {

Config Config::defaults() {
    return Config{};
}

Config Config::load(const std::string& path) {
    Config cfg;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file not found: {}, using defaults", path);
        return cfg;
    }

    try {
        auto tbl = toml::parse_file(path);

        // [server]
        if (auto server = tbl["server"].as_table()) {
            if (auto v = (*server)["bind_address"].value<std::string>())
                cfg.server.bind_address = *v;
            if (auto v = (*server)["poll_timeout_ms"].value<int>())
                cfg.server.poll_timeout_ms = *v;
        }

        // [ledger]
        if (auto ledger = tbl["ledger"].as_table()) {
            if (auto v = (*ledger)["cost_basis_method"].value<std::string>())
                cfg.ledger.cost_basis_method = *v;
            if (auto v = (*ledger)["quantity_epsilon"].value<double>())
                cfg.ledger.quantity_epsilon = *v;
            if (auto v = (*ledger)["journal_path"].value<std::string>())
                cfg.ledger.journal_path = *v;
        }

        // [validation]
        if (auto validation = tbl["validation"].as_table()) {
            if (auto v = (*validation)["max_account_id_length"].value<int64_t>())
                cfg.validation.max_account_id_length = static_cast<size_t>(*v);
            if (auto v = (*validation)["max_symbol_length"].value<int64_t>())
                cfg.validation.max_symbol_length = static_cast<size_t>(*v);
            if (auto v = (*validation)["max_quantity"].value<double>())
                cfg.validation.max_quantity = *v;
            if (auto v = (*validation)["max_price"].value<double>())
                cfg.validation.max_price = *v;
            if (auto v = (*validation)["max_commission_rate"].value<double>())
                cfg.validation.max_commission_rate = *v;
        }

        // [valuation]
        if (auto valuation = tbl["valuation"].as_table()) {
            if (auto v = (*valuation)["missing_price_strategy"].value<std::string>())
                cfg.valuation.missing_price_strategy = *v;
        }

        // [logging]
        if (auto logging = tbl["logging"].as_table()) {
            if (auto v = (*logging)["level"].value<std::string>())
                cfg.logging.level = *v;
            if (auto v = (*logging)["file"].value<std::string>())
                cfg.logging.file = *v;
        }

        // [metrics]
        if (auto metrics = tbl["metrics"].as_table()) {
            if (auto v = (*metrics)["report_interval_s"].value<int>())
                cfg.metrics.report_interval_s = *v;
            if (auto v = (*metrics)["enabled"].value<bool>())
                cfg.metrics.enabled = *v;
        }
    } catch (const toml::parse_error& e) {
        spdlog::error("Failed to parse config: {}", e.what());
    }

    return cfg;
}

Config Config::load_with_overrides(const std::string& path, int argc, char* argv[]) {
    auto cfg = load(path);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.rfind("--bind=", 0) == 0) {
            cfg.server.bind_address = arg.substr(7);
        } else if (arg.rfind("--log-level=", 0) == 0) {
            cfg.logging.level = arg.substr(12);
        } else if (arg.rfind("--journal=", 0) == 0) {
            cfg.ledger.journal_path = arg.substr(10);
        } else if (arg.rfind("--cost-basis=", 0) == 0) {
            cfg.ledger.cost_basis_method = arg.substr(13);
        } else if (arg.rfind("--config=", 0) == 0) {
            // already handled via path
        } else {
            spdlog::warn("Ignoring unknown argument: {}", arg);
        }
    }

    return cfg;
}

}  // namespace lotledger::core
