#include <gtest/gtest.h>
#include <zmq.hpp>
#include <thread>
#include <chrono>

#include "messaging/protocol.hpp"
#include "messaging/request_router.hpp"
#include "messaging/zmq_server.hpp"
#include "service/ledger_service.hpp"
#include "storage/memory_ledger_store.hpp"

using namespace lotledger;

class IntegrationTest : public ::testing::Test {
protected:
    static constexpr const char* BIND_ADDR = "tcp://127.0.0.1:5558";

    storage::MemoryLedgerStore store;
    service::LedgerService ledger{store};
    messaging::RequestRouter router{ledger};
    std::unique_ptr<messaging::ZmqServer> server;
    std::thread server_thread;

    void SetUp() override {
        server = std::make_unique<messaging::ZmqServer>(BIND_ADDR, 20);
        server->set_handler(
            [this](const std::string& client_id, const ledgerwire::LedgerMessage& msg) {
                return router.handle(client_id, msg);
            });

        server_thread = std::thread([this] { server->run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    void TearDown() override {
        server->stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    // Send a protobuf message and receive a response using a raw DEALER socket
    ledgerwire::LedgerMessage send_and_recv(const ledgerwire::LedgerMessage& msg,
                                            int timeout_ms = 2000) {
        zmq::context_t ctx(1);
        zmq::socket_t sock(ctx, zmq::socket_type::dealer);
        sock.set(zmq::sockopt::routing_id, "test-cpp-client");
        sock.connect(BIND_ADDR);

        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        std::string data = messaging::serialize(msg);
        sock.send(zmq::message_t{}, zmq::send_flags::sndmore);
        sock.send(zmq::buffer(data), zmq::send_flags::none);

        zmq::pollitem_t items[] = {{sock, 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, 1, std::chrono::milliseconds(timeout_ms));

        if (items[0].revents & ZMQ_POLLIN) {
            zmq::message_t empty, response;
            (void)sock.recv(empty, zmq::recv_flags::none);
            (void)sock.recv(response, zmq::recv_flags::none);

            sock.close();
            ctx.close();
            return messaging::deserialize(response.data(), response.size());
        }

        sock.close();
        ctx.close();
        return {};
    }

    ledgerwire::LedgerMessage make_record_msg(const std::string& external_id,
                                              ledgerwire::Side side, double qty, double price,
                                              const std::string& date,
                                              const std::string& symbol = "AAPL") {
        ledgerwire::LedgerMessage msg;
        msg.set_sender_comp_id("TEST_CLIENT");
        msg.set_msg_seq_num(external_id + "-seq");
        msg.set_sending_time(messaging::current_timestamp());

        auto* tx = msg.mutable_record_transaction()->mutable_transaction();
        tx->set_account_id("ACC-ZMQ");
        tx->set_external_id(external_id);
        tx->set_symbol(symbol);
        tx->set_side(side);
        tx->set_quantity(qty);
        tx->set_price(price);
        tx->set_transaction_date(date);
        return msg;
    }
};

TEST_F(IntegrationTest, BuyOverZmq) {
    auto response = send_and_recv(make_record_msg("zmq-001", ledgerwire::SIDE_BUY, 100, 150.0, "2024-01-02"));

    ASSERT_TRUE(response.has_record_result());
    const auto& rr = response.record_result();
    EXPECT_EQ(rr.status(), ledgerwire::RECORD_STATUS_APPLIED);
    EXPECT_EQ(rr.transaction().external_id(), "zmq-001");
    EXPECT_EQ(rr.lots_touched_size(), 1);
    EXPECT_EQ(rr.position().quantity(), 100.0);
    EXPECT_EQ(response.target_comp_id(), "TEST_CLIENT");
}

TEST_F(IntegrationTest, FifoSellOverZmq) {
    send_and_recv(make_record_msg("zmq-b1", ledgerwire::SIDE_BUY, 10, 100.0, "2024-01-01", "MSFT"));
    send_and_recv(make_record_msg("zmq-b2", ledgerwire::SIDE_BUY, 10, 110.0, "2024-01-02", "MSFT"));

    auto response = send_and_recv(
        make_record_msg("zmq-s1", ledgerwire::SIDE_SELL, 15, 120.0, "2024-01-03", "MSFT"));

    ASSERT_TRUE(response.has_record_result());
    const auto& rr = response.record_result();
    ASSERT_EQ(rr.allocations_size(), 2);
    EXPECT_EQ(rr.allocations(0).quantity_sold(), 10.0);
    EXPECT_EQ(rr.allocations(1).quantity_sold(), 5.0);
    EXPECT_DOUBLE_EQ(rr.allocations(0).realized_pnl() + rr.allocations(1).realized_pnl(), 250.0);
}

TEST_F(IntegrationTest, RejectBadTransactionOverZmq) {
    auto response = send_and_recv(make_record_msg("zmq-bad", ledgerwire::SIDE_BUY, -10, 150.0, "2024-01-02"));

    ASSERT_TRUE(response.has_record_result());
    EXPECT_EQ(response.record_result().status(), ledgerwire::RECORD_STATUS_REJECTED);
    EXPECT_FALSE(response.record_result().text().empty());
    EXPECT_FALSE(ledger.get_position("ACC-ZMQ", "AAPL").has_value());
}

TEST_F(IntegrationTest, HeartbeatOverZmq) {
    ledgerwire::LedgerMessage msg;
    msg.set_sender_comp_id("TEST_CLIENT");
    msg.set_msg_seq_num("hb-seq-001");
    msg.set_sending_time(messaging::current_timestamp());
    msg.mutable_heartbeat()->set_test_req_id("test-req-001");

    auto response = send_and_recv(msg);

    EXPECT_TRUE(response.has_heartbeat());
    EXPECT_EQ(response.heartbeat().test_req_id(), "test-req-001");
}

TEST_F(IntegrationTest, SnapshotAndPositionQueryOverZmq) {
    send_and_recv(make_record_msg("zmq-pos-001", ledgerwire::SIDE_BUY, 25, 250.0, "2024-01-02", "TSLA"));

    ledgerwire::LedgerMessage snap_req;
    snap_req.set_sender_comp_id("TEST_CLIENT");
    auto* sr = snap_req.mutable_snapshot_request();
    sr->set_account_id("ACC-ZMQ");
    sr->set_symbol("TSLA");
    sr->set_valuation_date("2024-01-03");
    sr->set_market_price(260.0);

    auto snap = send_and_recv(snap_req);
    ASSERT_TRUE(snap.has_snapshot_report());
    EXPECT_DOUBLE_EQ(snap.snapshot_report().unrealized_pnl(), 250.0);

    ledgerwire::LedgerMessage query;
    query.set_sender_comp_id("TEST_CLIENT");
    query.set_msg_seq_num("pq-seq-001");
    query.mutable_position_request()->set_pos_req_id("pos-req-001");
    query.mutable_position_request()->set_account_id("ACC-ZMQ");

    auto response = send_and_recv(query);

    ASSERT_TRUE(response.has_position_report());
    EXPECT_EQ(response.position_report().pos_req_id(), "pos-req-001");

    bool found = false;
    for (const auto& entry : response.position_report().positions()) {
        if (entry.symbol() == "TSLA") {
            EXPECT_EQ(entry.quantity(), 25.0);
            EXPECT_EQ(entry.avg_cost(), 250.0);
            found = true;
        }
    }
    EXPECT_TRUE(found) << "TSLA position not found";
}
