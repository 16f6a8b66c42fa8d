#include <chrono>
#include <csignal>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/metrics.hpp"
#include "messaging/request_router.hpp"
#include "messaging/zmq_server.hpp"
#include "service/ledger_service.hpp"
#include "storage/journal_ledger_store.hpp"
#include "storage/memory_ledger_store.hpp"

static lotledger::messaging::ZmqServer* g_server = nullptr;

void signal_handler(int) {
    if (g_server) g_server->stop();
}

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    // Find config file from --config= arg, or use default path
    std::string config_path = "config/default.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        }
    }

    auto cfg = lotledger::core::Config::load_with_overrides(config_path, argc, argv);

    lotledger::core::init_logging(cfg.logging.level, cfg.logging.file);

    std::unique_ptr<lotledger::storage::LedgerStore> store;
    try {
        if (cfg.ledger.journal_path.empty()) {
            store = std::make_unique<lotledger::storage::MemoryLedgerStore>();
            spdlog::warn("[STORE] No journal configured, ledger is in-memory only");
        } else {
            auto journal = std::make_unique<lotledger::storage::JournalLedgerStore>(
                cfg.ledger.journal_path);
            spdlog::info("[STORE] Journal {} replayed {} entries",
                         journal->path(), journal->replayed_entries());
            store = std::move(journal);
        }
    } catch (const lotledger::core::StorageError& e) {
        spdlog::critical("[STORE] Cannot open ledger: {}", e.what());
        return 1;
    }

    std::unique_ptr<lotledger::service::LedgerService> ledger;
    try {
        ledger = std::make_unique<lotledger::service::LedgerService>(*store, cfg);
    } catch (const std::invalid_argument& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    lotledger::messaging::RequestRouter router(*ledger);

    lotledger::messaging::ZmqServer server(cfg.server.bind_address, cfg.server.poll_timeout_ms);
    g_server = &server;

    server.set_handler(
        [&router](const std::string& client_id, const ledgerwire::LedgerMessage& msg) {
            return router.handle(client_id, msg);
        });

    auto& metrics = lotledger::core::Metrics::instance();
    if (cfg.metrics.enabled && cfg.metrics.report_interval_s > 0) {
        server.set_periodic(std::chrono::seconds(cfg.metrics.report_interval_s),
                            [&metrics] { spdlog::info("{}", metrics.to_string()); });
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("lotledger listening on {} (protobuf), cost basis {}",
                 cfg.server.bind_address, ledger->lot_policy().name());
    server.run();

    spdlog::info("Shutdown. Transactions applied: {}", metrics.transactions_applied.load());
    if (cfg.metrics.enabled) {
        spdlog::info("{}", metrics.to_string());
    }
    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
