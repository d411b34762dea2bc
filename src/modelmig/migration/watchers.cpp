#include "modelmig/migration/watchers.h"
#include "modelmig/migration/collections.h"
#include "modelmig/migration/minion_reports.h"

namespace modelmig {
namespace migration {

namespace {

bool has_prefix(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

core::Result<WatcherPtr> start_watcher(std::unique_ptr<watcher::DocumentWatcher> w) {
    auto started = w->start();
    if (!started.ok()) {
        return started.err();
    }
    return WatcherPtr(std::move(w));
}

} // namespace

core::Result<WatcherPtr> watch_model_migration(std::shared_ptr<storage::DocumentStore> store,
                                               const std::string& model_uuid) {
    // Last epoch seen by the check; only the loop thread touches it after start.
    // The epoch only grows, so a migration that starts and ends between two
    // checks still reads as a change.
    auto last = std::make_shared<int64_t>(-1);
    auto reader = store;
    auto check = [reader, model_uuid, last]() -> core::Result<bool> {
        auto doc = reader->find(collections::kModels, model_uuid);
        int64_t epoch = -1;
        if (doc.ok()) {
            epoch = doc.value().int_or(model_fields::kMigrationEpoch, 0);
        } else if (!doc.is(core::Error::Code::NOT_FOUND)) {
            return doc.err();
        }
        bool changed = epoch != *last;
        *last = epoch;
        return changed;
    };
    auto filter = [model_uuid](const storage::Change& change) {
        return change.collection == collections::kModels && change.id == model_uuid;
    };
    return start_watcher(std::make_unique<watcher::DocumentWatcher>(
        std::move(store), "model-migration:" + model_uuid, filter, check));
}

core::Result<WatcherPtr> watch_migration_status(std::shared_ptr<storage::DocumentStore> store,
                                                const std::string& model_uuid) {
    std::string prefix = model_uuid + ":";
    auto filter = [prefix](const storage::Change& change) {
        return change.collection == collections::kMigrationStatus && has_prefix(change.id, prefix);
    };
    return start_watcher(std::make_unique<watcher::DocumentWatcher>(
        std::move(store), "migration-status:" + model_uuid, filter));
}

core::Result<WatcherPtr> watch_minion_reports(std::shared_ptr<storage::DocumentStore> store,
                                              const std::string& migration_id,
                                              core::Phase phase) {
    std::string prefix = MinionReportAggregator::phase_prefix(migration_id, phase);
    auto filter = [prefix](const storage::Change& change) {
        return change.collection == collections::kMinionSync && has_prefix(change.id, prefix);
    };
    return start_watcher(std::make_unique<watcher::DocumentWatcher>(
        std::move(store), "minion-reports:" + prefix, filter));
}

} // namespace migration
} // namespace modelmig
