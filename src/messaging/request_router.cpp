#include "messaging/request_router.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"
#include "core/metrics.hpp"

namespace lotledger::messaging {

RequestRouter::RequestRouter(service::LedgerService& ledger) : ledger_(ledger) {}

std::vector<ledgerwire::LedgerMessage> RequestRouter::handle(
    const std::string& client_id, const ledgerwire::LedgerMessage& msg) {

    auto& metrics = core::Metrics::instance();
    metrics.messages_in++;

    std::vector<ledgerwire::LedgerMessage> responses;
    try {
        if (msg.has_record_transaction()) {
            responses = on_record_transaction(client_id, msg);
        } else if (msg.has_snapshot_request()) {
            responses = on_snapshot_request(client_id, msg);
        } else if (msg.has_position_request()) {
            responses = on_position_request(client_id, msg);
        } else if (msg.has_heartbeat()) {
            spdlog::debug("[RECV] Heartbeat from={}", client_id);
            responses.push_back(make_heartbeat_response(msg));
        } else {
            spdlog::warn("[RECV] Unknown message from={}", client_id);
            responses.push_back(make_reject(msg, "Unknown message type"));
        }
    } catch (const core::StorageError& e) {
        spdlog::error("[RECV] Storage failure handling message from={}: {}", client_id, e.what());
        responses.push_back(make_reject(msg, std::string("Storage failure: ") + e.what()));
    }

    metrics.messages_out += responses.size();
    return responses;
}

std::vector<ledgerwire::LedgerMessage> RequestRouter::on_record_transaction(
    const std::string& client_id, const ledgerwire::LedgerMessage& msg) {

    const auto& record = msg.record_transaction().transaction();
    spdlog::info("[RECV] RecordTransaction from={} account={} symbol={} external_id={}",
                 client_id, record.account_id(), record.symbol(), record.external_id());

    auto result = ledger_.record_transaction(to_request(record));
    return {make_record_result(msg, result)};
}

std::vector<ledgerwire::LedgerMessage> RequestRouter::on_snapshot_request(
    const std::string& client_id, const ledgerwire::LedgerMessage& msg) {

    const auto& req = msg.snapshot_request();
    spdlog::info("[RECV] SnapshotRequest from={} account={} symbol={} date={}",
                 client_id, req.account_id(), req.symbol(), req.valuation_date());

    try {
        auto valuation_date = core::parse_date_or_throw(req.valuation_date(), "valuation_date");

        // No price supplied: fall back to the closes seen on earlier requests.
        if (req.market_price() == 0.0 && req.price_date().empty()) {
            auto snapshot = ledger_.snapshot_from_closes(req.account_id(), req.symbol(),
                                                         valuation_date);
            if (!snapshot) {
                return {make_reject(msg, "No price for " + req.symbol() + " on " +
                                             valuation_date.to_string())};
            }
            return {make_snapshot_report(msg, *snapshot)};
        }

        valuation::PriceQuote quote;
        quote.price = req.market_price();
        quote.observed_date = req.price_date().empty()
            ? valuation_date
            : core::parse_date_or_throw(req.price_date(), "price_date");

        auto snapshot = ledger_.snapshot_valuation(req.account_id(), req.symbol(),
                                                   valuation_date, quote);
        ledger_.record_close(req.symbol(), quote.observed_date, quote.price);
        return {make_snapshot_report(msg, snapshot)};
    } catch (const core::ValidationError& e) {
        spdlog::warn("[RECV] SnapshotRequest rejected: {}", e.what());
        return {make_reject(msg, e.what())};
    }
}

std::vector<ledgerwire::LedgerMessage> RequestRouter::on_position_request(
    const std::string& client_id, const ledgerwire::LedgerMessage& msg) {

    const auto& req = msg.position_request();
    spdlog::info("[RECV] PositionRequest from={} account={}", client_id, req.account_id());

    std::vector<booking::Position> positions;
    if (req.symbol().empty()) {
        positions = ledger_.get_positions(req.account_id(), req.active_only());
    } else if (auto pos = ledger_.get_position(req.account_id(), req.symbol())) {
        if (!req.active_only() || pos->is_active) positions.push_back(*pos);
    }

    return {make_position_report(msg, generate_uuid(), positions)};
}

}  // namespace lotledger::messaging
