#include "messaging/protocol.hpp"

namespace lotledger::messaging {

namespace {

ledgerwire::LedgerMessage make_envelope(const ledgerwire::LedgerMessage& request) {
    ledgerwire::LedgerMessage msg;
    msg.set_sender_comp_id(kCompId);
    msg.set_target_comp_id(request.sender_comp_id());
    msg.set_msg_seq_num(generate_uuid());
    msg.set_sending_time(current_timestamp());
    return msg;
}

}  // namespace

std::string serialize(const ledgerwire::LedgerMessage& msg) {
    return msg.SerializeAsString();
}

ledgerwire::LedgerMessage deserialize(const std::string& data) {
    ledgerwire::LedgerMessage msg;
    msg.ParseFromString(data);
    return msg;
}

ledgerwire::LedgerMessage deserialize(const void* data, size_t size) {
    ledgerwire::LedgerMessage msg;
    msg.ParseFromArray(data, static_cast<int>(size));
    return msg;
}

booking::TransactionRequest to_request(const ledgerwire::TransactionRecord& proto) {
    booking::TransactionRequest req;
    req.account_id = proto.account_id();
    if (!proto.external_id().empty()) req.external_id = proto.external_id();
    req.symbol = proto.symbol();
    switch (proto.side()) {
        case ledgerwire::SIDE_BUY:  req.side = "BUY"; break;
        case ledgerwire::SIDE_SELL: req.side = "SELL"; break;
        default: break;  // left empty, fails validation
    }
    req.quantity = proto.quantity();
    req.price = proto.price();
    req.commission = proto.commission();
    req.transaction_date = proto.transaction_date();
    req.notes = proto.notes();
    return req;
}

ledgerwire::TransactionRecord to_proto(const booking::Transaction& tx) {
    ledgerwire::TransactionRecord proto;
    proto.set_transaction_id(tx.id);
    proto.set_account_id(tx.account_id);
    if (tx.external_id) proto.set_external_id(*tx.external_id);
    proto.set_symbol(tx.symbol);
    proto.set_side(tx.side == booking::Side::Buy ? ledgerwire::SIDE_BUY : ledgerwire::SIDE_SELL);
    proto.set_quantity(tx.quantity);
    proto.set_price(tx.price);
    proto.set_commission(tx.commission);
    proto.set_transaction_date(tx.transaction_date.to_string());
    proto.set_notes(tx.notes);
    if (tx.lot_id) proto.set_lot_id(*tx.lot_id);
    return proto;
}

ledgerwire::LotRecord to_proto(const booking::PositionLot& lot) {
    ledgerwire::LotRecord proto;
    proto.set_lot_id(lot.id);
    proto.set_transaction_id(lot.transaction_id);
    proto.set_original_quantity(lot.original_quantity);
    proto.set_remaining_quantity(lot.remaining_quantity);
    proto.set_cost_basis(lot.cost_basis);
    proto.set_purchase_date(lot.purchase_date.to_string());
    proto.set_is_closed(lot.is_closed);
    return proto;
}

ledgerwire::AllocationRecord to_proto(const booking::SaleAllocation& alloc) {
    ledgerwire::AllocationRecord proto;
    proto.set_allocation_id(alloc.id);
    proto.set_sale_transaction_id(alloc.sale_transaction_id);
    proto.set_lot_id(alloc.lot_id);
    proto.set_quantity_sold(alloc.quantity_sold);
    proto.set_cost_basis(alloc.cost_basis);
    proto.set_sale_price(alloc.sale_price);
    proto.set_realized_pnl(alloc.realized_pnl);
    proto.set_commission_allocated(alloc.commission_allocated);
    return proto;
}

ledgerwire::PositionRecord to_proto(const booking::Position& pos) {
    ledgerwire::PositionRecord proto;
    proto.set_account_id(pos.account_id);
    proto.set_symbol(pos.symbol);
    proto.set_quantity(pos.quantity);
    proto.set_avg_cost(pos.avg_cost);
    proto.set_total_cost(pos.total_cost);
    proto.set_first_buy_date(pos.first_buy_date.to_string());
    proto.set_last_transaction_date(pos.last_transaction_date.to_string());
    proto.set_is_active(pos.is_active);
    return proto;
}

ledgerwire::SnapshotReport to_proto(const valuation::DailyPnLSnapshot& snap) {
    ledgerwire::SnapshotReport proto;
    proto.set_account_id(snap.account_id);
    proto.set_symbol(snap.symbol);
    proto.set_valuation_date(snap.valuation_date.to_string());
    proto.set_quantity(snap.quantity);
    proto.set_avg_cost(snap.avg_cost);
    proto.set_market_price(snap.market_price);
    proto.set_market_value(snap.market_value);
    proto.set_unrealized_pnl(snap.unrealized_pnl);
    proto.set_unrealized_pnl_pct(snap.unrealized_pnl_pct);
    proto.set_realized_pnl(snap.realized_pnl);
    proto.set_realized_pnl_pct(snap.realized_pnl_pct);
    proto.set_total_cost(snap.total_cost);
    proto.set_price_date(snap.price_date.to_string());
    proto.set_is_stale_price(snap.is_stale_price);
    return proto;
}

ledgerwire::RecordStatus to_proto(booking::RecordStatus status) {
    switch (status) {
        case booking::RecordStatus::Applied:        return ledgerwire::RECORD_STATUS_APPLIED;
        case booking::RecordStatus::AlreadyApplied: return ledgerwire::RECORD_STATUS_ALREADY_APPLIED;
        case booking::RecordStatus::Rejected:       return ledgerwire::RECORD_STATUS_REJECTED;
    }
    return ledgerwire::RECORD_STATUS_UNSPECIFIED;
}

ledgerwire::RejectReason to_proto(booking::RejectReason reason) {
    switch (reason) {
        case booking::RejectReason::None:                 return ledgerwire::REJECT_REASON_NONE;
        case booking::RejectReason::Validation:           return ledgerwire::REJECT_REASON_VALIDATION;
        case booking::RejectReason::InsufficientLots:     return ledgerwire::REJECT_REASON_INSUFFICIENT_LOTS;
        case booking::RejectReason::DuplicateTransaction: return ledgerwire::REJECT_REASON_DUPLICATE_TRANSACTION;
    }
    return ledgerwire::REJECT_REASON_NONE;
}

ledgerwire::LedgerMessage make_record_result(
    const ledgerwire::LedgerMessage& request,
    const booking::RecordResult& result) {

    auto msg = make_envelope(request);
    auto* rr = msg.mutable_record_result();
    rr->set_status(to_proto(result.status));
    rr->set_reason(to_proto(result.reason));
    rr->set_text(result.text);

    if (result.transaction) {
        *rr->mutable_transaction() = to_proto(*result.transaction);
    } else if (request.has_record_transaction()) {
        *rr->mutable_transaction() = request.record_transaction().transaction();
    }
    if (result.position) *rr->mutable_position() = to_proto(*result.position);
    for (const auto& lot : result.lots_touched) *rr->add_lots_touched() = to_proto(lot);
    for (const auto& alloc : result.allocations) *rr->add_allocations() = to_proto(alloc);

    return msg;
}

ledgerwire::LedgerMessage make_snapshot_report(
    const ledgerwire::LedgerMessage& request,
    const valuation::DailyPnLSnapshot& snapshot) {

    auto msg = make_envelope(request);
    *msg.mutable_snapshot_report() = to_proto(snapshot);
    return msg;
}

ledgerwire::LedgerMessage make_position_report(
    const ledgerwire::LedgerMessage& request,
    const std::string& rpt_id,
    const std::vector<booking::Position>& positions) {

    auto msg = make_envelope(request);
    auto* pr = msg.mutable_position_report();
    if (request.has_position_request()) {
        pr->set_pos_req_id(request.position_request().pos_req_id());
    }
    pr->set_pos_rpt_id(rpt_id);
    for (const auto& pos : positions) *pr->add_positions() = to_proto(pos);

    return msg;
}

ledgerwire::LedgerMessage make_reject(
    const ledgerwire::LedgerMessage& request,
    const std::string& reason) {

    auto msg = make_envelope(request);
    auto* rej = msg.mutable_reject();
    rej->set_ref_msg_seq_num(request.msg_seq_num());
    rej->set_text(reason);
    return msg;
}

ledgerwire::LedgerMessage make_heartbeat_response(const ledgerwire::LedgerMessage& request) {
    auto msg = make_envelope(request);
    auto* hb = msg.mutable_heartbeat();
    if (request.has_heartbeat()) {
        hb->set_test_req_id(request.heartbeat().test_req_id());
    }
    return msg;
}

}  // namespace lotledger::messaging
