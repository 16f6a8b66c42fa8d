#pragma once

#include <ledger_messages.pb.h>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "booking/position.hpp"
#include "booking/position_lot.hpp"
#include "booking/record_result.hpp"
#include "booking/sale_allocation.hpp"
#include "booking/transaction.hpp"
#include "core/date.hpp"
#include "valuation/daily_pnl.hpp"

namespace lotledger::messaging {

inline constexpr const char* kCompId = "LOTLEDGER";

inline std::string generate_uuid() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint32_t> dis;

    std::ostringstream ss;
    ss << std::hex;
    ss << dis(gen) << "-" << (dis(gen) & 0xFFFF) << "-"
       << (dis(gen) & 0xFFFF) << "-" << (dis(gen) & 0xFFFF) << "-"
       << dis(gen) << dis(gen);
    return ss.str();
}

using core::current_timestamp;

std::string serialize(const ledgerwire::LedgerMessage& msg);
ledgerwire::LedgerMessage deserialize(const std::string& data);
ledgerwire::LedgerMessage deserialize(const void* data, size_t size);

// Domain <-> wire
booking::TransactionRequest to_request(const ledgerwire::TransactionRecord& proto);
ledgerwire::TransactionRecord to_proto(const booking::Transaction& tx);
ledgerwire::LotRecord to_proto(const booking::PositionLot& lot);
ledgerwire::AllocationRecord to_proto(const booking::SaleAllocation& alloc);
ledgerwire::PositionRecord to_proto(const booking::Position& pos);
ledgerwire::SnapshotReport to_proto(const valuation::DailyPnLSnapshot& snap);
ledgerwire::RecordStatus to_proto(booking::RecordStatus status);
ledgerwire::RejectReason to_proto(booking::RejectReason reason);

// Responses. Each is addressed back to the request's sender.
ledgerwire::LedgerMessage make_record_result(
    const ledgerwire::LedgerMessage& request,
    const booking::RecordResult& result);

ledgerwire::LedgerMessage make_snapshot_report(
    const ledgerwire::LedgerMessage& request,
    const valuation::DailyPnLSnapshot& snapshot);

ledgerwire::LedgerMessage make_position_report(
    const ledgerwire::LedgerMessage& request,
    const std::string& rpt_id,
    const std::vector<booking::Position>& positions);

ledgerwire::LedgerMessage make_reject(
    const ledgerwire::LedgerMessage& request,
    const std::string& reason);

ledgerwire::LedgerMessage make_heartbeat_response(const ledgerwire::LedgerMessage& request);

}  // namespace lotledger::messaging
