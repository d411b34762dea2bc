#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>
#include "modelmig/storage/document_store.h"

namespace modelmig {
namespace storage {
namespace {

class DocumentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<DocumentStore>();
        ASSERT_TRUE(store_->open().ok());
    }

    void TearDown() override {
        ASSERT_TRUE(store_->close().ok());
    }

    static Document Counter(int64_t value) {
        Document doc;
        doc.set_int("counter", value);
        return doc;
    }

    std::shared_ptr<DocumentStore> store_;
};

TEST_F(DocumentStoreTest, InsertAndFind) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());

    auto found = store_->find("things", "a");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().int_or("counter", 0), 1);
    EXPECT_EQ(found.value().revision(), 1u);
    EXPECT_EQ(store_->revision(), 1u);
    EXPECT_EQ(store_->count("things"), 1u);
}

TEST_F(DocumentStoreTest, FindMissing) {
    auto found = store_->find("things", "nope");
    ASSERT_FALSE(found.ok());
    EXPECT_TRUE(found.is(core::Error::Code::NOT_FOUND));
    EXPECT_EQ(found.error(), "things/nope not found");
}

TEST_F(DocumentStoreTest, DuplicateInsertAborts) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    auto result = store_->run_transaction({TxnOp::Insert("things", "a", Counter(2))});
    EXPECT_TRUE(result.is(core::Error::Code::TXN_ABORTED));
    EXPECT_EQ(store_->find("things", "a").value().int_or("counter", 0), 1);
}

TEST_F(DocumentStoreTest, UpdateMissingAborts) {
    auto result = store_->run_transaction({TxnOp::Update("things", "a", Counter(2))});
    EXPECT_TRUE(result.is(core::Error::Code::TXN_ABORTED));
    EXPECT_EQ(store_->count("things"), 0u);
    EXPECT_EQ(store_->revision(), 0u);
}

TEST_F(DocumentStoreTest, UpdateMergesFieldsAndUnsets) {
    Document doc = Counter(1);
    doc.set_string("name", "x").set_string("scratch", "y");
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", doc)}).ok());

    TxnOp update = TxnOp::Update("things", "a", Counter(2));
    update.unset("scratch");
    ASSERT_TRUE(store_->run_transaction({update}).ok());

    auto found = store_->find("things", "a");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().int_or("counter", 0), 2);
    EXPECT_EQ(found.value().string_or("name", ""), "x");
    EXPECT_FALSE(found.value().has("scratch"));
    EXPECT_EQ(found.value().revision(), 2u);
}

TEST_F(DocumentStoreTest, UpdateIncrementsIntFields) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(5))}).ok());

    TxnOp update = TxnOp::Update("things", "a", Document());
    update.increment("counter").increment("fresh", 3);
    ASSERT_TRUE(store_->run_transaction({update}).ok());

    auto found = store_->find("things", "a");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().int_or("counter", 0), 6);
    EXPECT_EQ(found.value().int_or("fresh", 0), 3);

    // An aborted increment changes nothing
    TxnOp guarded = TxnOp::Update("things", "a", Document());
    guarded.assert_int("counter", 5).increment("counter");
    EXPECT_TRUE(store_->run_transaction({guarded}).is(core::Error::Code::TXN_ABORTED));
    EXPECT_EQ(store_->find("things", "a").value().int_or("counter", 0), 6);
}

TEST_F(DocumentStoreTest, FieldAssertions) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());

    auto stale = store_->run_transaction({TxnOp::Update("things", "a", Counter(5)).assert_int("counter", 0)});
    EXPECT_TRUE(stale.is(core::Error::Code::TXN_ABORTED));

    auto fresh = store_->run_transaction({TxnOp::Update("things", "a", Counter(5)).assert_int("counter", 1)});
    EXPECT_TRUE(fresh.ok());

    // A missing field only matches a null expectation
    auto null_ok = store_->run_transaction({TxnOp::Assert("things", "a").assert_null("owner")});
    EXPECT_TRUE(null_ok.ok());
    auto typed = store_->run_transaction({TxnOp::Assert("things", "a").assert_string("owner", "")});
    EXPECT_TRUE(typed.is(core::Error::Code::TXN_ABORTED));
}

TEST_F(DocumentStoreTest, TypedAssertionDoesNotMatchOtherType) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    auto result = store_->run_transaction({TxnOp::Assert("things", "a").assert_string("counter", "1")});
    EXPECT_TRUE(result.is(core::Error::Code::TXN_ABORTED));
}

TEST_F(DocumentStoreTest, RevisionAssertion) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    uint64_t revision = store_->find("things", "a").value().revision();

    ASSERT_TRUE(store_->run_transaction({TxnOp::Update("things", "a", Counter(2)).assert_revision(revision)}).ok());
    auto again = store_->run_transaction({TxnOp::Update("things", "a", Counter(3)).assert_revision(revision)});
    EXPECT_TRUE(again.is(core::Error::Code::TXN_ABORTED));
}

TEST_F(DocumentStoreTest, AllOrNothing) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());

    TxnOps ops;
    ops.push_back(TxnOp::Insert("things", "b", Counter(1)));
    ops.push_back(TxnOp::Update("things", "a", Counter(9)));
    ops.push_back(TxnOp::Insert("things", "a", Counter(1)));  // fails
    auto result = store_->run_transaction(ops);
    EXPECT_TRUE(result.is(core::Error::Code::TXN_ABORTED));

    EXPECT_EQ(store_->count("things"), 1u);
    EXPECT_EQ(store_->find("things", "a").value().int_or("counter", 0), 1);
    EXPECT_EQ(store_->revision(), 1u);
}

TEST_F(DocumentStoreTest, AssertionsSeeStateBeforeTransaction) {
    // The update asserts a document that only the same transaction inserts
    TxnOps ops;
    ops.push_back(TxnOp::Insert("things", "a", Counter(1)));
    ops.push_back(TxnOp::Update("things", "a", Counter(2)));
    EXPECT_TRUE(store_->run_transaction(ops).is(core::Error::Code::TXN_ABORTED));
}

TEST_F(DocumentStoreTest, Remove) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    ASSERT_TRUE(store_->run_transaction({TxnOp::Remove("things", "a")}).ok());
    EXPECT_TRUE(store_->find("things", "a").is(core::Error::Code::NOT_FOUND));
    EXPECT_TRUE(store_->run_transaction({TxnOp::Remove("things", "a")}).is(core::Error::Code::TXN_ABORTED));
}

TEST_F(DocumentStoreTest, FindAllSortedAndFiltered) {
    for (const char* id : {"c", "a", "b"}) {
        ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", id, Counter(id[0] - 'a'))}).ok());
    }
    auto all = store_->find_all("things");
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].first, "a");
    EXPECT_EQ(all.value()[2].first, "c");

    auto some = store_->find_all("things", [](const std::string&, const Document& doc) {
        return doc.int_or("counter", 0) > 0;
    });
    ASSERT_TRUE(some.ok());
    ASSERT_EQ(some.value().size(), 2u);
    EXPECT_EQ(some.value()[0].first, "b");

    auto none = store_->find_all("other");
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(DocumentStoreTest, AssertOnlyTransactionWritesNothing) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    uint64_t published = store_->hub().published_count();
    ASSERT_TRUE(store_->run_transaction({TxnOp::Assert("things", "a").assert_exists()}).ok());
    EXPECT_EQ(store_->revision(), 1u);
    EXPECT_EQ(store_->hub().published_count(), published);
}

TEST_F(DocumentStoreTest, PublishesOneBatchPerCommit) {
    std::vector<ChangeHub::BatchPtr> batches;
    auto id = store_->hub().subscribe([&batches](const ChangeHub::BatchPtr& batch) {
        batches.push_back(batch);
    });

    TxnOps ops;
    ops.push_back(TxnOp::Insert("things", "a", Counter(1)));
    ops.push_back(TxnOp::Insert("others", "b", Counter(1)));
    ASSERT_TRUE(store_->run_transaction(ops).ok());
    ASSERT_TRUE(store_->run_transaction({TxnOp::Remove("things", "a")}).ok());
    EXPECT_FALSE(store_->run_transaction({TxnOp::Remove("things", "a")}).ok());
    store_->hub().unsubscribe(id);

    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0]->revision, 1u);
    ASSERT_EQ(batches[0]->changes.size(), 2u);
    EXPECT_EQ(batches[0]->changes[0].collection, "things");
    EXPECT_EQ(batches[0]->changes[1].id, "b");
    EXPECT_FALSE(batches[0]->changes[0].removed);
    EXPECT_TRUE(batches[1]->changes[0].removed);
}

TEST_F(DocumentStoreTest, HooksRunOncePerTransactionInOrder) {
    std::vector<int> calls;
    store_->add_before_txn_hook([this, &calls]() {
        calls.push_back(1);
        // Not intercepted by the second hook
        ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "from-hook", Counter(1))}).ok());
    });
    store_->add_before_txn_hook([&calls]() { calls.push_back(2); });
    EXPECT_EQ(store_->pending_hooks(), 2u);

    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    EXPECT_EQ(calls, (std::vector<int>{1}));
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "b", Counter(1))}).ok());
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
    EXPECT_EQ(store_->pending_hooks(), 0u);
    EXPECT_EQ(store_->count("things"), 3u);
}

TEST_F(DocumentStoreTest, HookCanCauseAbort) {
    store_->add_before_txn_hook([this]() {
        ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(7))}).ok());
    });
    auto result = store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))});
    EXPECT_TRUE(result.is(core::Error::Code::TXN_ABORTED));
    EXPECT_EQ(store_->find("things", "a").value().int_or("counter", 0), 7);
}

TEST_F(DocumentStoreTest, ThrowingHookDoesNotDisableLaterHooks) {
    store_->add_before_txn_hook([]() { throw std::runtime_error("hook failed"); });
    EXPECT_THROW(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}), std::runtime_error);
    EXPECT_EQ(store_->count("things"), 0u);

    bool ran = false;
    store_->add_before_txn_hook([&ran]() { ran = true; });
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(1))}).ok());
    EXPECT_TRUE(ran);
    EXPECT_EQ(store_->pending_hooks(), 0u);
}

TEST(DocumentStoreLifecycleTest, RequiresOpen) {
    DocumentStore store;
    auto result = store.run_transaction({TxnOp::Insert("things", "a", Document())});
    EXPECT_TRUE(result.is(core::Error::Code::INTERNAL));
    ASSERT_TRUE(store.open().ok());
    EXPECT_FALSE(store.open().ok());
    EXPECT_TRUE(store.close().ok());
    EXPECT_TRUE(store.close().ok());
}

class TransactionRunnerTest : public DocumentStoreTest {};

TEST_F(TransactionRunnerTest, RebuildsAfterAbort) {
    ASSERT_TRUE(store_->run_transaction({TxnOp::Insert("things", "a", Counter(0))}).ok());
    store_->add_before_txn_hook([this]() {
        ASSERT_TRUE(store_->run_transaction({TxnOp::Update("things", "a", Counter(10))}).ok());
    });

    std::vector<int> attempts;
    TransactionRunner runner(store_, 3);
    auto result = runner.run([&](int attempt) -> core::Result<TxnOps> {
        attempts.push_back(attempt);
        int64_t current = store_->find("things", "a").value().int_or("counter", 0);
        TxnOps ops;
        ops.push_back(TxnOp::Update("things", "a", Counter(current + 1)).assert_int("counter", current));
        return ops;
    });
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(attempts, (std::vector<int>{0, 1}));
    EXPECT_EQ(store_->find("things", "a").value().int_or("counter", 0), 11);
}

TEST_F(TransactionRunnerTest, BuilderErrorStopsRun) {
    int calls = 0;
    TransactionRunner runner(store_, 3);
    auto result = runner.run([&](int) -> core::Result<TxnOps> {
        calls++;
        return core::ConflictError("already in progress");
    });
    EXPECT_TRUE(result.is(core::Error::Code::CONFLICT));
    EXPECT_EQ(calls, 1);
}

TEST_F(TransactionRunnerTest, NoOperationsIsSuccess) {
    TransactionRunner runner(store_, 3);
    auto result = runner.run([](int) -> core::Result<TxnOps> { return TxnOps{}; });
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(store_->revision(), 0u);
}

TEST_F(TransactionRunnerTest, ExcessiveContention) {
    int calls = 0;
    TransactionRunner runner(store_, 3);
    auto result = runner.run([&](int) -> core::Result<TxnOps> {
        calls++;
        TxnOps ops;
        ops.push_back(TxnOp::Update("things", "never", Counter(1)));
        return ops;
    });
    EXPECT_TRUE(result.is(core::Error::Code::EXCESSIVE_CONTENTION));
    EXPECT_EQ(result.error(), "state changing too quickly; try again soon");
    EXPECT_EQ(calls, 3);
}

} // namespace
} // namespace storage
} // namespace modelmig
