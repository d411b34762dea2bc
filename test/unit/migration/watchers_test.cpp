#include <gtest/gtest.h>

#include "modelmig/migration/watchers.h"
#include "test_util/migration_fixture.h"

namespace modelmig {
namespace migration {
namespace {

using core::Phase;

class MigrationWatchersTest : public testutil::MigrationTestBase {
protected:
    WatcherPtr WatchForMigration(const std::string& model_uuid) {
        auto w = coordinator_->watch_for_model_migration(model_uuid);
        EXPECT_TRUE(w.ok()) << w.error();
        return w.ok() ? w.take_value() : nullptr;
    }

    WatcherPtr WatchStatus(const std::string& model_uuid) {
        auto w = coordinator_->watch_migration_status(model_uuid);
        EXPECT_TRUE(w.ok()) << w.error();
        return w.ok() ? w.take_value() : nullptr;
    }
};

TEST_F(MigrationWatchersTest, WatchForMigrationStartAndEnd) {
    auto w = WatchForMigration(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    auto mig = CreateMigration(model_);
    ASSERT_NE(mig, nullptr);
    AssertOneChange(*w);

    // Intermediate phases leave the marker alone
    SetPhases(*mig, {Phase::READONLY, Phase::ABORT});
    AssertNoChange(*w);
    ASSERT_TRUE(mig->set_status_message("aborting").ok());
    AssertNoChange(*w);

    SetPhases(*mig, {Phase::ABORTDONE});
    AssertOneChange(*w);

    AssertStops(*w);
}

TEST_F(MigrationWatchersTest, WatchForMigrationInProgress) {
    auto mig = CreateMigration(model_);
    ASSERT_NE(mig, nullptr);

    auto w = WatchForMigration(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    SetPhases(*mig, {Phase::ABORT, Phase::ABORTDONE});
    AssertOneChange(*w);

    auto next = CreateMigration(model_);
    ASSERT_NE(next, nullptr);
    AssertOneChange(*w);
}

TEST_F(MigrationWatchersTest, WatchForMigrationSeesShortLivedMigrations) {
    auto w = WatchForMigration(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    // Start and end land back to back, often before the watcher re-reads
    // the model; the model reads the same before and after apart from its epoch
    for (int i = 0; i < 20; ++i) {
        auto mig = CreateMigration(model_);
        ASSERT_NE(mig, nullptr);
        SetPhases(*mig, {Phase::ABORT, Phase::ABORTDONE});
        EXPECT_EQ(w->wait(std::chrono::seconds(5)), watcher::WatchEvent::CHANGED) << "cycle " << i;
        while (w->wait(std::chrono::milliseconds(50)) == watcher::WatchEvent::CHANGED) {
        }
    }
}

TEST_F(MigrationWatchersTest, WatchForMigrationIgnoresOtherModels) {
    auto w = WatchForMigration(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    auto other = CreateMigration(model2_);
    ASSERT_NE(other, nullptr);
    AssertNoChange(*w);

    ASSERT_TRUE(coordinator_->models().set_mode(model_, "importing").ok());
    AssertNoChange(*w);
}

TEST_F(MigrationWatchersTest, WatchForMigrationOfSeveralModels) {
    auto w1 = WatchForMigration(model_);
    auto w2 = WatchForMigration(model2_);
    ASSERT_NE(w1, nullptr);
    ASSERT_NE(w2, nullptr);
    AssertOneChange(*w1);
    AssertOneChange(*w2);

    auto mig = CreateMigration(model_);
    ASSERT_NE(mig, nullptr);
    AssertOneChange(*w1);
    AssertNoChange(*w2);

    auto mig2 = CreateMigration(model2_);
    ASSERT_NE(mig2, nullptr);
    AssertNoChange(*w1);
    AssertOneChange(*w2);
}

TEST_F(MigrationWatchersTest, WatchStatus) {
    auto w = WatchStatus(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    auto mig = CreateMigration(model_);
    ASSERT_NE(mig, nullptr);
    AssertOneChange(*w);

    SetPhases(*mig, {Phase::READONLY});
    AssertOneChange(*w);

    ASSERT_TRUE(mig->set_status_message("exporting data").ok());
    AssertOneChange(*w);

    SetPhases(*mig, {Phase::ABORT});
    AssertOneChange(*w);
    SetPhases(*mig, {Phase::ABORTDONE});
    AssertOneChange(*w);

    // A failed transition writes nothing
    EXPECT_FALSE(mig->set_phase(Phase::QUIESCE).ok());
    AssertNoChange(*w);

    auto next = CreateMigration(model_);
    ASSERT_NE(next, nullptr);
    AssertOneChange(*w);
}

TEST_F(MigrationWatchersTest, WatchStatusPreexistingMigration) {
    auto mig = CreateMigration(model_);
    ASSERT_NE(mig, nullptr);

    auto w = WatchStatus(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    SetPhases(*mig, {Phase::READONLY});
    AssertOneChange(*w);
}

TEST_F(MigrationWatchersTest, WatchStatusIgnoresOtherModels) {
    auto w = WatchStatus(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);

    auto other = CreateMigration(model2_);
    ASSERT_NE(other, nullptr);
    SetPhases(*other, {Phase::READONLY});
    AssertNoChange(*w);
}

TEST_F(MigrationWatchersTest, StoppedWatcherSeesNothing) {
    auto w = WatchStatus(model_);
    ASSERT_NE(w, nullptr);
    AssertOneChange(*w);
    AssertStops(*w);

    ASSERT_NE(CreateMigration(model_), nullptr);
    EXPECT_EQ(w->wait(std::chrono::milliseconds(50)), watcher::WatchEvent::CLOSED);
    EXPECT_TRUE(w->stopped());
}

} // namespace
} // namespace migration
} // namespace modelmig
