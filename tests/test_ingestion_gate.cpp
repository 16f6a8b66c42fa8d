#include <gtest/gtest.h>
#include <cmath>
#include "booking/ingestion_gate.hpp"
#include "core/errors.hpp"
#include "storage/memory_ledger_store.hpp"

using namespace lotledger::booking;
using lotledger::core::ValidationError;
using lotledger::storage::MemoryLedgerStore;

namespace {

TransactionRequest make_request(const std::string& side, double qty, double price,
                                const std::string& date = "2024-01-02",
                                std::optional<std::string> external_id = std::nullopt) {
    TransactionRequest req;
    req.account_id = "ACC-1";
    req.external_id = std::move(external_id);
    req.symbol = "AAPL";
    req.side = side;
    req.quantity = qty;
    req.price = price;
    req.transaction_date = date;
    return req;
}

class IngestionGateTest : public ::testing::Test {
protected:
    MemoryLedgerStore store_;
    LotAllocationEngine engine_{std::make_unique<FifoPolicy>()};
    PositionAggregator aggregator_;
    IngestionGate gate_{store_, engine_, aggregator_};
};

}  // namespace

TEST_F(IngestionGateTest, ValidRequestPasses) {
    auto tx = gate_.validate(make_request("buy", 10, 100.0));
    EXPECT_EQ(tx.side, Side::Buy);
    EXPECT_EQ(tx.id, 0u);
    EXPECT_EQ(tx.transaction_date.to_string(), "2024-01-02");
    EXPECT_FALSE(tx.external_id.has_value());
}

TEST_F(IngestionGateTest, ValidationRules) {
    auto req = make_request("BUY", 10, 100.0);

    auto bad = req; bad.account_id = "";
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.account_id = std::string(101, 'A');
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.symbol = "";
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.symbol = std::string(21, 'X');
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.side = "HOLD";
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.quantity = 0.0;
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.quantity = -1.0;
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.quantity = std::nan("");
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.quantity = 20'000'000.0;
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.price = 0.0;
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.price = 2'000'000.0;
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.commission = -0.01;
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.commission = 101.0;  // over 10% of 1000 notional
    EXPECT_THROW(gate_.validate(bad), ValidationError);
    bad = req; bad.transaction_date = "2024-02-30";
    EXPECT_THROW(gate_.validate(bad), ValidationError);

    auto ok = req; ok.commission = 100.0;
    EXPECT_NO_THROW(gate_.validate(ok));
}

TEST_F(IngestionGateTest, EmptyExternalIdTreatedAsAbsent) {
    auto tx = gate_.validate(make_request("BUY", 10, 100.0, "2024-01-02", std::string()));
    EXPECT_FALSE(tx.external_id.has_value());
}

TEST_F(IngestionGateTest, ValidationRejectLeavesNoTrace) {
    auto result = gate_.submit(make_request("BUY", -5, 100.0));
    EXPECT_EQ(result.status, RecordStatus::Rejected);
    EXPECT_EQ(result.reason, RejectReason::Validation);
    EXPECT_FALSE(result.text.empty());
    EXPECT_EQ(store_.transaction_count(), 0u);
    EXPECT_FALSE(store_.position("ACC-1", "AAPL").has_value());
}

TEST_F(IngestionGateTest, BuyOpensLotAndPosition) {
    auto result = gate_.submit(make_request("BUY", 10, 100.0, "2024-01-01", std::string("E-1")));
    ASSERT_EQ(result.status, RecordStatus::Applied);
    ASSERT_TRUE(result.transaction.has_value());
    ASSERT_TRUE(result.transaction->lot_id.has_value());
    EXPECT_FALSE(result.transaction->created_at.empty());

    ASSERT_EQ(result.lots_touched.size(), 1u);
    EXPECT_EQ(result.lots_touched[0].id, *result.transaction->lot_id);
    EXPECT_TRUE(result.allocations.empty());

    ASSERT_TRUE(result.position.has_value());
    EXPECT_DOUBLE_EQ(result.position->quantity, 10.0);
    EXPECT_DOUBLE_EQ(result.position->avg_cost, 100.0);
    EXPECT_EQ(result.position->first_buy_date.to_string(), "2024-01-01");
}

TEST_F(IngestionGateTest, SellBeyondHoldingsRejected) {
    gate_.submit(make_request("BUY", 10, 100.0, "2024-01-01"));
    auto result = gate_.submit(make_request("SELL", 11, 100.0, "2024-01-02"));

    EXPECT_EQ(result.status, RecordStatus::Rejected);
    EXPECT_EQ(result.reason, RejectReason::InsufficientLots);
    EXPECT_EQ(store_.transaction_count(), 1u);
    EXPECT_EQ(store_.allocation_count(), 0u);
    EXPECT_DOUBLE_EQ(store_.position("ACC-1", "AAPL")->quantity, 10.0);
}

TEST_F(IngestionGateTest, ReplayReturnsStoredResult) {
    gate_.submit(make_request("BUY", 10, 100.0, "2024-01-01", std::string("B-1")));
    auto first = gate_.submit(make_request("SELL", 4, 120.0, "2024-01-02", std::string("S-1")));
    ASSERT_EQ(first.status, RecordStatus::Applied);

    auto again = make_request("SELL", 4, 120.0, "2024-01-02", std::string("S-1"));
    again.notes = "resent by upstream";
    auto second = gate_.submit(again);

    EXPECT_EQ(second.status, RecordStatus::AlreadyApplied);
    EXPECT_EQ(second.transaction->id, first.transaction->id);
    ASSERT_EQ(second.allocations.size(), 1u);
    EXPECT_EQ(second.allocations[0].id, first.allocations[0].id);
    EXPECT_DOUBLE_EQ(second.realized_pnl(), 80.0);
    EXPECT_EQ(store_.transaction_count(), 2u);
    EXPECT_DOUBLE_EQ(store_.position("ACC-1", "AAPL")->quantity, 6.0);
}

TEST_F(IngestionGateTest, ConflictingReplayRejected) {
    gate_.submit(make_request("BUY", 10, 100.0, "2024-01-01", std::string("B-1")));
    auto result = gate_.submit(make_request("BUY", 11, 100.0, "2024-01-01", std::string("B-1")));

    EXPECT_EQ(result.status, RecordStatus::Rejected);
    EXPECT_EQ(result.reason, RejectReason::DuplicateTransaction);
    EXPECT_EQ(store_.transaction_count(), 1u);
    EXPECT_DOUBLE_EQ(store_.position("ACC-1", "AAPL")->quantity, 10.0);
}

TEST_F(IngestionGateTest, BackdatedTradeKeepsLatestTransactionDate) {
    gate_.submit(make_request("BUY", 10, 100.0, "2024-01-05"));
    auto result = gate_.submit(make_request("BUY", 10, 90.0, "2024-01-02"));

    ASSERT_TRUE(result.position.has_value());
    EXPECT_EQ(result.position->last_transaction_date.to_string(), "2024-01-05");
    EXPECT_EQ(result.position->first_buy_date.to_string(), "2024-01-02");
}
