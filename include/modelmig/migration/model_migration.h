#ifndef MODELMIG_MIGRATION_MODEL_MIGRATION_H_
#define MODELMIG_MIGRATION_MODEL_MIGRATION_H_

#include <cstdint>
#include <memory>
#include <string>

#include "modelmig/core/config.h"
#include "modelmig/core/migration_spec.h"
#include "modelmig/core/phase.h"
#include "modelmig/core/result.h"
#include "modelmig/core/types.h"
#include "modelmig/migration/minion_reports.h"
#include "modelmig/migration/model_registry.h"
#include "modelmig/migration/watchers.h"
#include "modelmig/storage/document_store.h"

namespace modelmig {
namespace migration {

/**
 * @brief Collaborators shared by the coordinator and every handle it returns
 */
struct CoordinatorContext {
    std::shared_ptr<storage::DocumentStore> store;
    std::shared_ptr<ModelRegistry> models;
    std::shared_ptr<MinionReportAggregator> reports;
    std::shared_ptr<core::Clock> clock;
    core::CoordinatorConfig config;
};

/**
 * @brief A caller's view of one migration attempt
 *
 * The handle caches the status fields read when it was loaded. Writers
 * assert those cached values, so a handle that has fallen behind fails
 * with RACE until refresh() is called. A handle is owned by one caller;
 * concurrency happens between handles.
 */
class ModelMigration {
public:
    /**
     * @brief Loads migration `id`; NOT_FOUND "migration not found" if absent
     */
    static core::Result<std::unique_ptr<ModelMigration>> Load(std::shared_ptr<const CoordinatorContext> context,
                                                              const std::string& id);

    const std::string& id() const { return id_; }
    const std::string& model_uuid() const { return model_uuid_; }
    int64_t attempt() const { return attempt_; }
    const core::Tag& initiated_by() const { return initiated_by_; }

    core::Phase phase() const { return phase_; }
    core::Timestamp phase_changed_time() const { return phase_changed_time_; }
    core::Timestamp start_time() const { return start_time_; }
    core::Timestamp success_time() const { return success_time_; }
    core::Timestamp end_time() const { return end_time_; }
    const std::string& status_message() const { return status_message_; }

    core::Result<void> set_status_message(const std::string& text);

    // Read from the separately stored target document
    core::Result<core::TargetInfo> target_info() const;

    /**
     * @brief Moves the migration to `next`
     *
     * Fails with ILLEGAL_TRANSITION if `next` is not reachable from the
     * cached phase, and with RACE "phase already changed" if the stored
     * phase no longer matches it. Neither case is retried. Entering a
     * terminal phase also ends the migration on the model record.
     */
    core::Result<void> set_phase(core::Phase next);

    core::Result<void> minion_report(const core::Tag& agent, core::Phase phase, bool success);

    // Reports for the cached phase
    core::Result<MinionReports> get_minion_reports() const;
    core::Result<MinionReports> get_minion_reports(core::Phase phase) const;

    // Tracks the cached phase at the time of the call
    core::Result<WatcherPtr> watch_minion_reports() const;

    core::Result<void> refresh();

private:
    ModelMigration(std::shared_ptr<const CoordinatorContext> context, std::string id);

    std::shared_ptr<const CoordinatorContext> context_;
    std::string id_;
    std::string model_uuid_;
    int64_t attempt_ = 0;
    core::Tag initiated_by_;

    core::Phase phase_ = core::Phase::UNKNOWN;
    core::Timestamp phase_changed_time_ = 0;
    core::Timestamp start_time_ = 0;
    core::Timestamp success_time_ = 0;
    core::Timestamp end_time_ = 0;
    std::string status_message_;
    std::string previous_mode_;

    core::Result<void> load_status(const storage::Document& status);
};

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_MODEL_MIGRATION_H_
