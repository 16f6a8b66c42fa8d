#include <gtest/gtest.h>
#include "core/metrics.hpp"
#include "messaging/protocol.hpp"
#include "messaging/request_router.hpp"
#include "storage/memory_ledger_store.hpp"

using namespace lotledger;
using namespace lotledger::messaging;

namespace {

ledgerwire::LedgerMessage make_record_msg(const std::string& external_id, ledgerwire::Side side,
                                          double qty, double price, const std::string& date,
                                          const std::string& symbol = "AAPL") {
    ledgerwire::LedgerMessage msg;
    msg.set_sender_comp_id("CLIENT");
    msg.set_msg_seq_num(external_id + "-seq");
    msg.set_sending_time(current_timestamp());

    auto* tx = msg.mutable_record_transaction()->mutable_transaction();
    tx->set_account_id("ACC-1");
    tx->set_external_id(external_id);
    tx->set_symbol(symbol);
    tx->set_side(side);
    tx->set_quantity(qty);
    tx->set_price(price);
    tx->set_transaction_date(date);
    return msg;
}

ledgerwire::LedgerMessage make_snapshot_msg(const std::string& date, double price,
                                            const std::string& price_date = "") {
    ledgerwire::LedgerMessage msg;
    msg.set_sender_comp_id("CLIENT");
    msg.set_msg_seq_num("snap-" + date);
    auto* req = msg.mutable_snapshot_request();
    req->set_account_id("ACC-1");
    req->set_symbol("AAPL");
    req->set_valuation_date(date);
    req->set_market_price(price);
    req->set_price_date(price_date);
    return msg;
}

}  // namespace

TEST(Protocol, SerializeDeserializeRoundtrip) {
    auto msg = make_record_msg("ext-001", ledgerwire::SIDE_BUY, 100.0, 150.0, "2024-01-02");

    std::string bytes = serialize(msg);
    auto restored = deserialize(bytes);

    EXPECT_EQ(restored.sender_comp_id(), "CLIENT");
    ASSERT_TRUE(restored.has_record_transaction());
    const auto& tx = restored.record_transaction().transaction();
    EXPECT_EQ(tx.external_id(), "ext-001");
    EXPECT_EQ(tx.symbol(), "AAPL");
    EXPECT_EQ(tx.side(), ledgerwire::SIDE_BUY);
    EXPECT_EQ(tx.quantity(), 100.0);
    EXPECT_EQ(tx.transaction_date(), "2024-01-02");
}

TEST(Protocol, RequestFromWireRecord) {
    auto msg = make_record_msg("ext-002", ledgerwire::SIDE_SELL, 5.0, 10.0, "2024-01-02");
    auto req = to_request(msg.record_transaction().transaction());

    EXPECT_EQ(req.account_id, "ACC-1");
    ASSERT_TRUE(req.external_id.has_value());
    EXPECT_EQ(*req.external_id, "ext-002");
    EXPECT_EQ(req.side, "SELL");
    EXPECT_EQ(req.quantity, 5.0);

    ledgerwire::TransactionRecord bare;
    auto unset = to_request(bare);
    EXPECT_FALSE(unset.external_id.has_value());
    EXPECT_TRUE(unset.side.empty());
}

TEST(Protocol, RecordResultAddressedToSender) {
    auto request = make_record_msg("ext-003", ledgerwire::SIDE_BUY, 1.0, 1.0, "2024-01-02");

    booking::RecordResult result;
    result.status = booking::RecordStatus::Rejected;
    result.reason = booking::RejectReason::Validation;
    result.text = "quantity must be positive";

    auto response = make_record_result(request, result);
    EXPECT_EQ(response.sender_comp_id(), kCompId);
    EXPECT_EQ(response.target_comp_id(), "CLIENT");
    ASSERT_TRUE(response.has_record_result());
    const auto& rr = response.record_result();
    EXPECT_EQ(rr.status(), ledgerwire::RECORD_STATUS_REJECTED);
    EXPECT_EQ(rr.reason(), ledgerwire::REJECT_REASON_VALIDATION);
    EXPECT_EQ(rr.text(), "quantity must be positive");
    // Rejected requests echo the submitted transaction
    EXPECT_EQ(rr.transaction().external_id(), "ext-003");
}

TEST(Protocol, RejectReferencesRequest) {
    ledgerwire::LedgerMessage request;
    request.set_sender_comp_id("CLIENT");
    request.set_msg_seq_num("seq-009");

    auto response = make_reject(request, "Unknown message type");
    ASSERT_TRUE(response.has_reject());
    EXPECT_EQ(response.reject().ref_msg_seq_num(), "seq-009");
    EXPECT_EQ(response.reject().text(), "Unknown message type");
}

class RequestRouterTest : public ::testing::Test {
protected:
    storage::MemoryLedgerStore store_;
    service::LedgerService ledger_{store_};
    RequestRouter router_{ledger_};

    void SetUp() override {
        core::Metrics::instance().reset();
    }

    ledgerwire::LedgerMessage handle_one(const ledgerwire::LedgerMessage& msg) {
        auto responses = router_.handle("client-1", msg);
        EXPECT_EQ(responses.size(), 1u);
        return responses.empty() ? ledgerwire::LedgerMessage{} : responses.front();
    }
};

TEST_F(RequestRouterTest, RecordsFifoSale) {
    handle_one(make_record_msg("b1", ledgerwire::SIDE_BUY, 10, 100.0, "2024-01-01"));
    handle_one(make_record_msg("b2", ledgerwire::SIDE_BUY, 10, 110.0, "2024-01-02"));
    auto response = handle_one(make_record_msg("s1", ledgerwire::SIDE_SELL, 15, 120.0, "2024-01-03"));

    ASSERT_TRUE(response.has_record_result());
    const auto& rr = response.record_result();
    EXPECT_EQ(rr.status(), ledgerwire::RECORD_STATUS_APPLIED);
    ASSERT_EQ(rr.allocations_size(), 2);
    EXPECT_DOUBLE_EQ(rr.allocations(0).realized_pnl() + rr.allocations(1).realized_pnl(), 250.0);
    EXPECT_DOUBLE_EQ(rr.position().quantity(), 5.0);
    EXPECT_DOUBLE_EQ(rr.position().avg_cost(), 110.0);
    EXPECT_GT(rr.transaction().transaction_id(), 0u);

    EXPECT_EQ(core::Metrics::instance().messages_in.load(), 3u);
    EXPECT_EQ(core::Metrics::instance().messages_out.load(), 3u);
}

TEST_F(RequestRouterTest, ReplayAndRejectStatuses) {
    auto buy = make_record_msg("b1", ledgerwire::SIDE_BUY, 10, 100.0, "2024-01-01");
    handle_one(buy);
    EXPECT_EQ(handle_one(buy).record_result().status(), ledgerwire::RECORD_STATUS_ALREADY_APPLIED);

    auto oversell = handle_one(make_record_msg("s1", ledgerwire::SIDE_SELL, 11, 100.0, "2024-01-02"));
    EXPECT_EQ(oversell.record_result().status(), ledgerwire::RECORD_STATUS_REJECTED);
    EXPECT_EQ(oversell.record_result().reason(), ledgerwire::REJECT_REASON_INSUFFICIENT_LOTS);

    auto no_side = handle_one(make_record_msg("x1", ledgerwire::SIDE_UNSPECIFIED, 1, 100.0, "2024-01-02"));
    EXPECT_EQ(no_side.record_result().reason(), ledgerwire::REJECT_REASON_VALIDATION);
}

TEST_F(RequestRouterTest, SnapshotRequest) {
    handle_one(make_record_msg("b1", ledgerwire::SIDE_BUY, 10, 100.0, "2024-01-01"));

    auto response = handle_one(make_snapshot_msg("2024-01-02", 105.0));
    ASSERT_TRUE(response.has_snapshot_report());
    const auto& snap = response.snapshot_report();
    EXPECT_DOUBLE_EQ(snap.market_value(), 1050.0);
    EXPECT_DOUBLE_EQ(snap.unrealized_pnl(), 50.0);
    EXPECT_EQ(snap.price_date(), "2024-01-02");
    EXPECT_FALSE(snap.is_stale_price());

    // No price: the close recorded above is carried forward
    auto carried = handle_one(make_snapshot_msg("2024-01-03", 0.0));
    ASSERT_TRUE(carried.has_snapshot_report());
    EXPECT_DOUBLE_EQ(carried.snapshot_report().market_price(), 105.0);
    EXPECT_TRUE(carried.snapshot_report().is_stale_price());
}

TEST_F(RequestRouterTest, InvalidSnapshotRequestsRejected) {
    handle_one(make_record_msg("b1", ledgerwire::SIDE_BUY, 10, 100.0, "2024-01-01"));

    EXPECT_TRUE(handle_one(make_snapshot_msg("not-a-date", 105.0)).has_reject());
    EXPECT_TRUE(handle_one(make_snapshot_msg("2024-01-02", -1.0)).has_reject());
    EXPECT_TRUE(handle_one(make_snapshot_msg("2024-01-02", 105.0, "2024-01-03")).has_reject());
    EXPECT_TRUE(handle_one(make_snapshot_msg("2024-01-02", 0.0)).has_reject());
    EXPECT_EQ(store_.snapshot_count(), 0u);
}

TEST_F(RequestRouterTest, PositionRequest) {
    handle_one(make_record_msg("b1", ledgerwire::SIDE_BUY, 10, 100.0, "2024-01-01", "AAPL"));
    handle_one(make_record_msg("b2", ledgerwire::SIDE_BUY, 4, 50.0, "2024-01-01", "MSFT"));
    handle_one(make_record_msg("s2", ledgerwire::SIDE_SELL, 4, 55.0, "2024-01-02", "MSFT"));

    ledgerwire::LedgerMessage query;
    query.set_sender_comp_id("CLIENT");
    auto* req = query.mutable_position_request();
    req->set_pos_req_id("pr-1");
    req->set_account_id("ACC-1");

    auto all = handle_one(query);
    ASSERT_TRUE(all.has_position_report());
    EXPECT_EQ(all.position_report().pos_req_id(), "pr-1");
    EXPECT_EQ(all.position_report().positions_size(), 2);

    req->set_active_only(true);
    auto active = handle_one(query);
    ASSERT_EQ(active.position_report().positions_size(), 1);
    EXPECT_EQ(active.position_report().positions(0).symbol(), "AAPL");

    req->set_symbol("MSFT");
    EXPECT_EQ(handle_one(query).position_report().positions_size(), 0);
}

TEST_F(RequestRouterTest, HeartbeatAndUnknown) {
    ledgerwire::LedgerMessage hb;
    hb.set_sender_comp_id("CLIENT");
    hb.mutable_heartbeat()->set_test_req_id("hb-1");
    auto pong = handle_one(hb);
    ASSERT_TRUE(pong.has_heartbeat());
    EXPECT_EQ(pong.heartbeat().test_req_id(), "hb-1");

    ledgerwire::LedgerMessage empty;
    empty.set_sender_comp_id("CLIENT");
    EXPECT_TRUE(handle_one(empty).has_reject());
}
