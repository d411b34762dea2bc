#include "modelmig/migration/coordinator.h"
#include "modelmig/common/logger.h"
#include "modelmig/migration/collections.h"

namespace modelmig {
namespace migration {

MigrationCoordinator::MigrationCoordinator(std::shared_ptr<storage::DocumentStore> store,
                                           std::shared_ptr<MinionTopology> topology,
                                           std::shared_ptr<core::Clock> clock,
                                           const core::CoordinatorConfig& config)
    : context_(std::make_shared<CoordinatorContext>()) {
    context_->store = store;
    context_->models = std::make_shared<ModelRegistry>(store, config.modes);
    context_->reports = std::make_shared<MinionReportAggregator>(store, std::move(topology));
    context_->clock = std::move(clock);
    context_->config = config;
    sequences_ = std::make_shared<storage::SequenceGenerator>(store, config.store.max_txn_attempts);
}

core::Result<std::unique_ptr<MigrationCoordinator>> MigrationCoordinator::Open(
    const core::CoordinatorConfig& config,
    std::shared_ptr<MinionTopology> topology,
    std::shared_ptr<core::Clock> clock) {
    auto store = std::make_shared<storage::DocumentStore>(config.store);
    auto opened = store->open();
    if (!opened.ok()) {
        return opened.err().annotate("cannot open migration store");
    }
    return std::make_unique<MigrationCoordinator>(store, std::move(topology), std::move(clock), config);
}

std::string MigrationCoordinator::migration_id(const std::string& model_uuid, int64_t attempt) {
    return model_uuid + ":" + std::to_string(attempt);
}

core::Result<std::unique_ptr<ModelMigration>> MigrationCoordinator::create(const std::string& model_uuid,
                                                                           const core::MigrationSpec& spec) {
    auto valid = spec.validate();
    if (!valid.ok()) {
        return valid.err();
    }

    auto model = context_->models->get(model_uuid);
    if (!model.ok()) {
        return model.err();
    }
    if (model.value().is_controller_model) {
        return core::ConflictError("controllers can't be migrated");
    }
    if (spec.target_info.controller_tag.id() == model.value().controller_uuid) {
        return core::ConflictError("model already attached to target controller");
    }

    const auto& target = spec.target_info;
    std::string id;
    storage::TransactionRunner runner(context_->store, context_->config.store.max_txn_attempts);
    auto created = runner.run([&](int attempt) -> core::Result<storage::TxnOps> {
        // Re-read on every attempt; a concurrent creator may have won
        auto current = context_->models->get(model_uuid);
        if (!current.ok()) {
            return current.err();
        }
        if (current.value().life != Life::ALIVE) {
            return core::ConflictError("model is not alive");
        }
        if (!current.value().active_migration.empty()) {
            return core::ConflictError("already in progress");
        }

        auto claim = sequences_->claim(model_uuid, kMigrationSequence);
        if (!claim.ok()) {
            return claim.err();
        }
        id = migration_id(model_uuid, claim.value().value);
        if (attempt > 0) {
            MODELMIG_DEBUG("Retrying creation of migration {} (attempt {})", id, attempt);
        }

        core::Timestamp now = context_->clock->now();
        storage::TxnOps ops = std::move(claim.value().ops);

        storage::Document mig;
        mig.set_string(migration_fields::kModelUUID, model_uuid)
           .set_int(migration_fields::kAttempt, claim.value().value)
           .set_string(migration_fields::kInitiatedBy, spec.initiated_by.to_string());
        ops.push_back(storage::TxnOp::Insert(collections::kMigrations, id, std::move(mig)));

        storage::Document status;
        status.set_string(status_fields::kModelUUID, model_uuid)
              .set_string(status_fields::kPhase, core::phase_name(core::Phase::QUIESCE))
              .set_int(status_fields::kPhaseChangedTime, now)
              .set_int(status_fields::kStartTime, now)
              .set_int(status_fields::kSuccessTime, 0)
              .set_int(status_fields::kEndTime, 0)
              .set_string(status_fields::kStatusMessage, context_->config.initial_status_message)
              .set_string(status_fields::kPreviousMode, current.value().migration_mode);
        ops.push_back(storage::TxnOp::Insert(collections::kMigrationStatus, id, std::move(status)));

        storage::Document target_doc;
        target_doc.set_string(target_fields::kControllerTag, target.controller_tag.to_string())
                  .set_strings(target_fields::kAddrs, target.addrs)
                  .set_string(target_fields::kCACert, target.ca_cert)
                  .set_string(target_fields::kAuthTag, target.auth_tag.to_string())
                  .set_string(target_fields::kPassword, target.password);
        ops.push_back(storage::TxnOp::Insert(collections::kMigrationTarget, id, std::move(target_doc)));

        ops.push_back(context_->models->start_migration_op(model_uuid, id));
        return ops;
    });
    if (!created.ok()) {
        return created.err().annotate("failed to create migration");
    }

    MODELMIG_INFO("Created migration {} of model {} to {} (initiated by {})",
                  id, model_uuid, target.controller_tag.to_string(), spec.initiated_by.to_string());
    return ModelMigration::Load(context_, id);
}

core::Result<std::unique_ptr<ModelMigration>> MigrationCoordinator::get(const std::string& id) {
    return ModelMigration::Load(context_, id);
}

core::Result<std::unique_ptr<ModelMigration>> MigrationCoordinator::latest_for_model(const std::string& model_uuid) {
    auto docs = context_->store->find_all(collections::kMigrations,
                                          [&model_uuid](const std::string&, const storage::Document& doc) {
                                              return doc.string_or(migration_fields::kModelUUID, "") == model_uuid;
                                          });
    if (!docs.ok()) {
        return docs.err();
    }

    std::string latest;
    int64_t latest_attempt = -1;
    for (const auto& [id, doc] : docs.value()) {
        int64_t attempt = doc.int_or(migration_fields::kAttempt, -1);
        if (attempt > latest_attempt) {
            latest_attempt = attempt;
            latest = id;
        }
    }
    if (latest.empty()) {
        return core::NotFoundError("migration not found");
    }
    return ModelMigration::Load(context_, latest);
}

core::Result<bool> MigrationCoordinator::is_migration_active(const std::string& model_uuid) const {
    auto model = context_->models->get(model_uuid);
    if (!model.ok()) {
        if (model.is(core::Error::Code::NOT_FOUND)) {
            return false;
        }
        return model.err();
    }
    return !model.value().active_migration.empty();
}

core::Result<WatcherPtr> MigrationCoordinator::watch_for_model_migration(const std::string& model_uuid) const {
    return watch_model_migration(context_->store, model_uuid);
}

core::Result<WatcherPtr> MigrationCoordinator::watch_migration_status(const std::string& model_uuid) const {
    return migration::watch_migration_status(context_->store, model_uuid);
}

} // namespace migration
} // namespace modelmig
