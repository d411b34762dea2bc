#pragma once

#include <cstddef>
#include <string>

namespace modelmig {
namespace core {

/**
 * @brief Configuration for the document store and its journal
 */
struct StoreConfig {
    std::string data_dir;           // Journal directory; empty keeps the store in memory only
    size_t journal_segment_bytes;   // Rotate the journal segment past this size
    bool sync_journal;              // Flush the journal after every commit
    int max_txn_attempts;           // Builder invocations before giving up on contention

    // Default constructor
    StoreConfig() : journal_segment_bytes(64 * 1024 * 1024), sync_journal(true), max_txn_attempts(3) {}

    static StoreConfig Default() {
        return StoreConfig();
    }

    static StoreConfig Persistent(const std::string& dir) {
        StoreConfig config;
        config.data_dir = dir;
        return config;
    }
};

/**
 * @brief Logging setup for tools and services embedding the coordinator
 */
struct LogConfig {
    std::string level;   // trace, debug, info, warn, error, critical or off
    std::string file;    // Also append to this file when set

    LogConfig() : level("info") {}

    static LogConfig Default() {
        return LogConfig();
    }
};

/**
 * @brief Labels written to a model's migration-mode field
 */
struct MigrationModes {
    std::string active;      // Normal operation
    std::string exporting;   // Migration away from this controller in progress
    std::string importing;   // Model arriving on this controller
    std::string migrated;    // Migration finished successfully; model now lives elsewhere

    MigrationModes()
        : active("active"), exporting("exporting"), importing("importing"), migrated("migrated") {}

    static MigrationModes Default() {
        return MigrationModes();
    }
};

/**
 * @brief Top-level configuration of the migration coordinator
 */
struct CoordinatorConfig {
    StoreConfig store;
    MigrationModes modes;
    std::string initial_status_message;

    CoordinatorConfig() : initial_status_message("starting") {}

    static CoordinatorConfig Default() {
        return CoordinatorConfig();
    }
};

} // namespace core
} // namespace modelmig
