#include "modelmig/migration/model_migration.h"
#include "modelmig/common/logger.h"
#include "modelmig/migration/collections.h"

namespace modelmig {
namespace migration {

ModelMigration::ModelMigration(std::shared_ptr<const CoordinatorContext> context, std::string id)
    : context_(std::move(context)), id_(std::move(id)) {
}

core::Result<std::unique_ptr<ModelMigration>> ModelMigration::Load(
    std::shared_ptr<const CoordinatorContext> context, const std::string& id) {
    auto doc = context->store->find(collections::kMigrations, id);
    if (!doc.ok()) {
        if (doc.is(core::Error::Code::NOT_FOUND)) {
            return core::NotFoundError("migration not found");
        }
        return doc.err();
    }
    auto status = context->store->find(collections::kMigrationStatus, id);
    if (!status.ok()) {
        if (status.is(core::Error::Code::NOT_FOUND)) {
            return core::InternalError("migration " + id + " has no status document");
        }
        return status.err();
    }

    auto initiated_by = core::Tag::parse(doc.value().string_or(migration_fields::kInitiatedBy, ""));
    if (!initiated_by.ok()) {
        return initiated_by.err().annotate("migration " + id);
    }

    std::unique_ptr<ModelMigration> mig(new ModelMigration(std::move(context), id));
    mig->model_uuid_ = doc.value().string_or(migration_fields::kModelUUID, "");
    mig->attempt_ = doc.value().int_or(migration_fields::kAttempt, 0);
    mig->initiated_by_ = initiated_by.value();

    auto loaded = mig->load_status(status.value());
    if (!loaded.ok()) {
        return loaded.err();
    }
    return std::move(mig);
}

core::Result<void> ModelMigration::load_status(const storage::Document& status) {
    std::string name = status.string_or(status_fields::kPhase, "");
    core::Phase phase = core::parse_phase(name);
    if (phase == core::Phase::UNKNOWN || phase == core::Phase::NONE) {
        return core::InternalError("migration " + id_ + " has invalid phase \"" + name + "\"");
    }
    phase_ = phase;
    phase_changed_time_ = status.int_or(status_fields::kPhaseChangedTime, 0);
    start_time_ = status.int_or(status_fields::kStartTime, 0);
    success_time_ = status.int_or(status_fields::kSuccessTime, 0);
    end_time_ = status.int_or(status_fields::kEndTime, 0);
    status_message_ = status.string_or(status_fields::kStatusMessage, "");
    previous_mode_ = status.string_or(status_fields::kPreviousMode, "");
    return core::Result<void>();
}

core::Result<void> ModelMigration::refresh() {
    auto status = context_->store->find(collections::kMigrationStatus, id_);
    if (!status.ok()) {
        if (status.is(core::Error::Code::NOT_FOUND)) {
            return core::NotFoundError("migration status not found");
        }
        return status.err().annotate("migration status lookup failed");
    }
    return load_status(status.value());
}

core::Result<void> ModelMigration::set_status_message(const std::string& text) {
    storage::Document set;
    set.set_string(status_fields::kStatusMessage, text);
    auto result = context_->store->run_transaction(
        {storage::TxnOp::Update(collections::kMigrationStatus, id_, std::move(set))});
    if (!result.ok()) {
        if (result.is(core::Error::Code::TXN_ABORTED)) {
            return core::NotFoundError("migration status not found").annotate("failed to set migration status");
        }
        return result.err().annotate("failed to set migration status");
    }
    status_message_ = text;
    return result;
}

core::Result<core::TargetInfo> ModelMigration::target_info() const {
    auto doc = context_->store->find(collections::kMigrationTarget, id_);
    if (!doc.ok()) {
        if (doc.is(core::Error::Code::NOT_FOUND)) {
            return core::NotFoundError("migration target info not found");
        }
        return doc.err();
    }
    const auto& target = doc.value();

    auto controller = core::Tag::parse(target.string_or(target_fields::kControllerTag, ""));
    if (!controller.ok()) {
        return controller.err().annotate("migration " + id_ + " target");
    }
    auto auth = core::Tag::parse(target.string_or(target_fields::kAuthTag, ""));
    if (!auth.ok()) {
        return auth.err().annotate("migration " + id_ + " target");
    }

    core::TargetInfo info;
    info.controller_tag = controller.value();
    info.addrs = target.get_strings(target_fields::kAddrs).value_or(std::vector<std::string>{});
    info.ca_cert = target.string_or(target_fields::kCACert, "");
    info.auth_tag = auth.value();
    info.password = target.string_or(target_fields::kPassword, "");
    return info;
}

core::Result<void> ModelMigration::set_phase(core::Phase next) {
    if (!core::can_transition_to(phase_, next)) {
        return core::IllegalTransitionError(std::string("illegal phase change: ") +
                                            core::phase_name(phase_) + " -> " + core::phase_name(next));
    }

    const auto& modes = context_->config.modes;
    core::Timestamp now = context_->clock->now();
    core::Timestamp success_time = success_time_;
    core::Timestamp end_time = end_time_;

    storage::Document set;
    set.set_string(status_fields::kPhase, core::phase_name(next))
       .set_int(status_fields::kPhaseChangedTime, now);
    if (next == core::Phase::SUCCESS && success_time == 0) {
        success_time = now;
        set.set_int(status_fields::kSuccessTime, success_time);
    }

    storage::TxnOps ops;
    bool ending = core::is_terminal(next);
    if (ending && end_time == 0) {
        end_time = now;
        set.set_int(status_fields::kEndTime, end_time);
    }
    ops.push_back(storage::TxnOp::Update(collections::kMigrationStatus, id_, std::move(set))
                      .assert_string(status_fields::kPhase, core::phase_name(phase_)));

    std::string mode = modes.exporting;
    if (ending) {
        if (core::has_succeeded(next)) {
            mode = modes.migrated;
        } else {
            mode = previous_mode_.empty() ? modes.active : previous_mode_;
        }
        ops.push_back(context_->models->end_migration_op(model_uuid_, id_, mode));
    } else {
        ops.push_back(context_->models->keep_mode_op(model_uuid_, id_, mode));
    }

    auto result = context_->store->run_transaction(ops);
    if (!result.ok()) {
        if (!result.is(core::Error::Code::TXN_ABORTED)) {
            return result.err().annotate("failed to update phase");
        }
        // Tell a lost race from a model record that no longer points here
        auto status = context_->store->find(collections::kMigrationStatus, id_);
        if (!status.ok()) {
            return status.err().annotate("failed to update phase");
        }
        if (status.value().string_or(status_fields::kPhase, "") != core::phase_name(phase_)) {
            return core::RaceError("phase already changed");
        }
        return core::ConflictError("model " + model_uuid_ + " is not running migration " + id_);
    }

    MODELMIG_INFO("Migration {} phase {} -> {} (model mode {})",
                  id_, core::phase_name(phase_), core::phase_name(next), mode);
    phase_ = next;
    phase_changed_time_ = now;
    success_time_ = success_time;
    end_time_ = end_time;
    return result;
}

core::Result<void> ModelMigration::minion_report(const core::Tag& agent, core::Phase phase, bool success) {
    return context_->reports->report(id_, agent, phase, success);
}

core::Result<MinionReports> ModelMigration::get_minion_reports() const {
    return get_minion_reports(phase_);
}

core::Result<MinionReports> ModelMigration::get_minion_reports(core::Phase phase) const {
    return context_->reports->get(id_, model_uuid_, phase);
}

core::Result<WatcherPtr> ModelMigration::watch_minion_reports() const {
    return migration::watch_minion_reports(context_->store, id_, phase_);
}

} // namespace migration
} // namespace modelmig
