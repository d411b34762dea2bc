#include <gtest/gtest.h>
#include "modelmig/core/config.h"
#include <string>

namespace modelmig {
namespace core {
namespace {

TEST(StoreConfigTest, DefaultConstruction) {
    StoreConfig config = StoreConfig::Default();
    EXPECT_EQ(config.data_dir, "");
    EXPECT_EQ(config.journal_segment_bytes, 64u * 1024 * 1024);
    EXPECT_TRUE(config.sync_journal);
    EXPECT_EQ(config.max_txn_attempts, 3);
}

TEST(StoreConfigTest, Persistent) {
    StoreConfig config = StoreConfig::Persistent("/var/lib/modelmig");
    EXPECT_EQ(config.data_dir, "/var/lib/modelmig");
    EXPECT_EQ(config.max_txn_attempts, 3);
}

TEST(LogConfigTest, Defaults) {
    LogConfig config = LogConfig::Default();
    EXPECT_EQ(config.level, "info");
    EXPECT_TRUE(config.file.empty());
}

TEST(MigrationModesTest, DefaultLabels) {
    MigrationModes modes = MigrationModes::Default();
    EXPECT_EQ(modes.active, "active");
    EXPECT_EQ(modes.exporting, "exporting");
    EXPECT_EQ(modes.importing, "importing");
    EXPECT_EQ(modes.migrated, "migrated");
}

TEST(CoordinatorConfigTest, DefaultConstruction) {
    CoordinatorConfig config = CoordinatorConfig::Default();
    EXPECT_EQ(config.initial_status_message, "starting");
    EXPECT_EQ(config.store.data_dir, "");
    EXPECT_EQ(config.modes.exporting, "exporting");
}

TEST(CoordinatorConfigTest, CopyConstruction) {
    CoordinatorConfig original;
    original.store.data_dir = "/tmp/modelmig";
    original.modes.migrated = "dead";
    original.initial_status_message = "queued";

    CoordinatorConfig copy(original);
    EXPECT_EQ(copy.store.data_dir, "/tmp/modelmig");
    EXPECT_EQ(copy.modes.migrated, "dead");
    EXPECT_EQ(copy.initial_status_message, "queued");
}

} // namespace
} // namespace core
} // namespace modelmig
