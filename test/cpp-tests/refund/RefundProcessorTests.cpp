/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/refund/RefundProcessor.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace penny;
using namespace penny::refund;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

class MockRefundLedger : public RefundLedger
{
public:
    MOCK_METHOD(
        Quantity, refundedQuantity, (std::string_view, std::string_view), (const, override));
    MOCK_METHOD(std::vector<RefundRecord>, history, (std::string_view), (const, override));
    MOCK_METHOD(void, append, (std::span<const RefundRecord>), (override));
};

TransactionInput makeTransaction()
{
    return TransactionInput{
        .id = "T1",
        .currency = "USD",
        .amountMinor = 6895,
        .tipMinor = 500,
        .surchargeMinor = 188,
        .lines = {
            RefundableLine{.id = "L1", .unitPrice = DEC(15.99), .quantity = 2, .taxMinor = 320},
            RefundableLine{.id = "L2", .unitPrice = DEC(25.00), .quantity = 1, .taxMinor = 250},
            RefundableLine{.id = "L3", .unitPrice = DEC(2.85), .quantity = 2, .taxMinor = 57}
        }
    };
}

}  // namespace

//-------------------------------------------------------------------------

TEST(RefundProcessorTests, RejectedBatchAppendsNothing)
{
    StrictMock<MockRefundLedger> ledger;
    EXPECT_CALL(ledger, history(Eq("T1"))).WillOnce(Return(std::vector<RefundRecord>{
        RefundRecord{.transactionId = "T1", .lineId = "L2", .quantity = 1, .subtotalMinor = 2500}
    }));
    EXPECT_CALL(ledger, append(_)).Times(0);

    RefundProcessor processor{ledger};
    const std::vector<RefundRequest> requests{{"L1", 1}, {"L2", 1}};
    const auto result = processor.process(makeTransaction(), requests);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RefundErrorCode::ALREADY_REFUNDED);
    EXPECT_EQ(result.error().lineId, "L2");
}

TEST(RefundProcessorTests, AcceptedBatchAppendsOneRecordPerLine)
{
    StrictMock<MockRefundLedger> ledger;
    EXPECT_CALL(ledger, history(Eq("T1"))).WillOnce(Return(std::vector<RefundRecord>{}));
    EXPECT_CALL(ledger, append(SizeIs(2))).Times(1);

    RefundProcessor processor{ledger};
    const std::vector<RefundRequest> requests{{"L1", 1}, {"L3", 1}};
    const auto result = processor.process(makeTransaction(), requests);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->records.size(), 2u);
}

//-------------------------------------------------------------------------

TEST(RefundProcessorTests, InMemoryLedgerGuardsAgainstOverRefund)
{
    InMemoryRefundLedger ledger;
    RefundProcessor processor{ledger};
    const auto transaction = makeTransaction();

    const std::vector<RefundRequest> oneUnit{{"L1", 1}};
    ASSERT_TRUE(processor.process(transaction, oneUnit).has_value());
    EXPECT_EQ(ledger.refundedQuantity("T1", "L1"), 1);
    EXPECT_EQ(ledger.records().size(), 1u);

    const std::vector<RefundRequest> twoUnits{{"L1", 2}};
    const auto rejected = processor.process(transaction, twoUnits);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, RefundErrorCode::EXCEEDS_REMAINING);
    EXPECT_EQ(ledger.records().size(), 1u);

    const auto rest = processor.processFullRefund(transaction);
    ASSERT_TRUE(rest.has_value()) << rest.error().message;
    EXPECT_TRUE(rest->completesTransaction);
    EXPECT_EQ(ledger.records().size(), 4u);
    EXPECT_EQ(ledger.refundedQuantity("T1", "L1"), 2);
    EXPECT_EQ(ledger.refundedQuantity("T1", "L3"), 2);

    MinorAmount refunded{};
    for (const auto& record : ledger.history("T1")) {
        refunded += record.totalMinor;
    }
    EXPECT_EQ(refunded, 7583);

    EXPECT_FALSE(processor.processFullRefund(transaction).has_value());
    EXPECT_EQ(ledger.records().size(), 4u);
}

TEST(RefundProcessorTests, InMemoryLedgerKeepsTransactionsApart)
{
    InMemoryRefundLedger ledger{{
        RefundRecord{.transactionId = "T1", .lineId = "L1", .quantity = 1},
        RefundRecord{.transactionId = "T2", .lineId = "L1", .quantity = 2}
    }};

    EXPECT_EQ(ledger.refundedQuantity("T1", "L1"), 1);
    EXPECT_EQ(ledger.refundedQuantity("T2", "L1"), 2);
    EXPECT_EQ(ledger.refundedQuantity("T3", "L1"), 0);
    EXPECT_THAT(ledger.history("T2"), ElementsAre(Field(&RefundRecord::quantity, 2)));
}

//-------------------------------------------------------------------------
