#include <gtest/gtest.h>
#include <memory>
#include "modelmig/storage/sequence.h"

namespace modelmig {
namespace storage {
namespace {

class SequenceGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<DocumentStore>();
        ASSERT_TRUE(store_->open().ok());
        sequences_ = std::make_unique<SequenceGenerator>(store_);
    }

    std::shared_ptr<DocumentStore> store_;
    std::unique_ptr<SequenceGenerator> sequences_;
};

TEST_F(SequenceGeneratorTest, StartsAtZeroAndIncrements) {
    for (int64_t expected = 0; expected < 5; ++expected) {
        auto value = sequences_->next("model-a", "modelmigration");
        ASSERT_TRUE(value.ok()) << value.error();
        EXPECT_EQ(value.value(), expected);
    }
    EXPECT_EQ(sequences_->current("model-a", "modelmigration").value(), 5);
}

TEST_F(SequenceGeneratorTest, ScopesAreIndependent) {
    EXPECT_EQ(sequences_->next("model-a", "modelmigration").value(), 0);
    EXPECT_EQ(sequences_->next("model-a", "modelmigration").value(), 1);
    EXPECT_EQ(sequences_->next("model-b", "modelmigration").value(), 0);
    EXPECT_EQ(sequences_->next("model-a", "other").value(), 0);
}

TEST_F(SequenceGeneratorTest, ClaimIsNotConsumedUntilCommitted) {
    auto claim = sequences_->claim("model-a", "modelmigration");
    ASSERT_TRUE(claim.ok());
    EXPECT_EQ(claim.value().value, 0);
    EXPECT_EQ(sequences_->current("model-a", "modelmigration").value(), 0);

    // Dropping the ops leaves the value available
    auto again = sequences_->claim("model-a", "modelmigration");
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().value, 0);

    ASSERT_TRUE(store_->run_transaction(again.value().ops).ok());
    EXPECT_EQ(sequences_->current("model-a", "modelmigration").value(), 1);
}

TEST_F(SequenceGeneratorTest, StaleClaimAborts) {
    auto first = sequences_->claim("model-a", "modelmigration");
    auto second = sequences_->claim("model-a", "modelmigration");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    ASSERT_TRUE(store_->run_transaction(first.value().ops).ok());
    EXPECT_TRUE(store_->run_transaction(second.value().ops).is(core::Error::Code::TXN_ABORTED));

    // Both claims against an existing counter race the same way
    auto third = sequences_->claim("model-a", "modelmigration");
    auto fourth = sequences_->claim("model-a", "modelmigration");
    ASSERT_TRUE(store_->run_transaction(third.value().ops).ok());
    EXPECT_TRUE(store_->run_transaction(fourth.value().ops).is(core::Error::Code::TXN_ABORTED));
    EXPECT_EQ(sequences_->current("model-a", "modelmigration").value(), 2);
}

TEST_F(SequenceGeneratorTest, NextRetriesAfterConcurrentClaim) {
    ASSERT_TRUE(sequences_->next("model-a", "modelmigration").ok());
    store_->add_before_txn_hook([this]() {
        ASSERT_EQ(sequences_->next("model-a", "modelmigration").value(), 1);
    });
    auto value = sequences_->next("model-a", "modelmigration");
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(value.value(), 2);
}

TEST_F(SequenceGeneratorTest, CurrentOfUnknownSequenceIsZero) {
    auto value = sequences_->current("model-z", "modelmigration");
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(value.value(), 0);
    EXPECT_EQ(store_->count(SequenceGenerator::kCollection), 0u);
}

} // namespace
} // namespace storage
} // namespace modelmig
