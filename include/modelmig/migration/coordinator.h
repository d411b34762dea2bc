#ifndef MODELMIG_MIGRATION_COORDINATOR_H_
#define MODELMIG_MIGRATION_COORDINATOR_H_

#include <memory>
#include <string>

#include "modelmig/core/config.h"
#include "modelmig/core/migration_spec.h"
#include "modelmig/core/result.h"
#include "modelmig/core/types.h"
#include "modelmig/migration/model_migration.h"
#include "modelmig/migration/model_registry.h"
#include "modelmig/migration/topology.h"
#include "modelmig/migration/watchers.h"
#include "modelmig/storage/document_store.h"
#include "modelmig/storage/sequence.h"

namespace modelmig {
namespace migration {

/**
 * @brief Entry point for starting and inspecting model migrations
 *
 * One coordinator serves every caller of a store. It holds no locks of its
 * own: all consistency comes from assertions inside store transactions,
 * so several coordinators over the same store behave like one.
 */
class MigrationCoordinator {
public:
    /**
     * @brief Uses an already opened store
     */
    MigrationCoordinator(std::shared_ptr<storage::DocumentStore> store,
                         std::shared_ptr<MinionTopology> topology,
                         std::shared_ptr<core::Clock> clock = core::SystemClock::Instance(),
                         const core::CoordinatorConfig& config = core::CoordinatorConfig::Default());

    /**
     * @brief Creates and opens a store from config.store, replaying its
     * journal when a data directory is configured
     */
    static core::Result<std::unique_ptr<MigrationCoordinator>> Open(
        const core::CoordinatorConfig& config,
        std::shared_ptr<MinionTopology> topology,
        std::shared_ptr<core::Clock> clock = core::SystemClock::Instance());

    /**
     * @brief Starts a migration of `model_uuid` in QUIESCE
     *
     * Fails with NOT_VALID for a bad spec, NOT_FOUND for an unknown model
     * and CONFLICT when the model is the controller model, already lives
     * on the target controller, is not alive or is already migrating.
     * The attempt number is consumed only when creation commits.
     */
    core::Result<std::unique_ptr<ModelMigration>> create(const std::string& model_uuid,
                                                         const core::MigrationSpec& spec);

    core::Result<std::unique_ptr<ModelMigration>> get(const std::string& id);

    // The migration with the highest attempt for the model
    core::Result<std::unique_ptr<ModelMigration>> latest_for_model(const std::string& model_uuid);

    core::Result<bool> is_migration_active(const std::string& model_uuid) const;

    core::Result<WatcherPtr> watch_for_model_migration(const std::string& model_uuid) const;
    core::Result<WatcherPtr> watch_migration_status(const std::string& model_uuid) const;

    ModelRegistry& models() { return *context_->models; }
    std::shared_ptr<storage::DocumentStore> store() const { return context_->store; }
    const core::CoordinatorConfig& config() const { return context_->config; }

    static std::string migration_id(const std::string& model_uuid, int64_t attempt);

private:
    std::shared_ptr<CoordinatorContext> context_;
    std::shared_ptr<storage::SequenceGenerator> sequences_;
};

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_COORDINATOR_H_
