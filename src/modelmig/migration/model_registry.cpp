#include "modelmig/migration/model_registry.h"
#include "modelmig/common/logger.h"
#include "modelmig/core/types.h"
#include "modelmig/migration/collections.h"

namespace modelmig {
namespace migration {

const char* life_name(Life life) {
    switch (life) {
        case Life::ALIVE: return "alive";
        case Life::DYING: return "dying";
        case Life::DEAD: return "dead";
    }
    return "unknown";
}

core::Result<Life> parse_life(const std::string& name) {
    if (name == "alive") return Life::ALIVE;
    if (name == "dying") return Life::DYING;
    if (name == "dead") return Life::DEAD;
    return core::NotValidError("life \"" + name + "\" not valid");
}

ModelRegistry::ModelRegistry(std::shared_ptr<storage::DocumentStore> store, core::MigrationModes modes)
    : store_(std::move(store)), modes_(std::move(modes)) {
}

core::Result<ModelInfo> ModelRegistry::add_model(const std::string& name,
                                                 const std::string& owner,
                                                 const std::string& controller_uuid,
                                                 bool is_controller_model) {
    return add_model_with_uuid(core::new_uuid(), name, owner, controller_uuid, is_controller_model);
}

core::Result<ModelInfo> ModelRegistry::add_model_with_uuid(const std::string& uuid,
                                                           const std::string& name,
                                                           const std::string& owner,
                                                           const std::string& controller_uuid,
                                                           bool is_controller_model) {
    if (!core::is_valid_uuid(uuid)) {
        return core::NotValidError("model uuid \"" + uuid + "\" not valid");
    }
    if (name.empty()) {
        return core::NotValidError("empty model name not valid");
    }
    if (!core::is_valid_uuid(controller_uuid)) {
        return core::NotValidError("controller uuid \"" + controller_uuid + "\" not valid");
    }

    ModelInfo info;
    info.uuid = uuid;
    info.name = name;
    info.owner = owner;
    info.controller_uuid = controller_uuid;
    info.life = Life::ALIVE;
    info.migration_mode = modes_.active;
    info.is_controller_model = is_controller_model;

    storage::Document doc;
    doc.set_string(model_fields::kName, info.name)
       .set_string(model_fields::kOwner, info.owner)
       .set_string(model_fields::kControllerUUID, info.controller_uuid)
       .set_string(model_fields::kLife, life_name(info.life))
       .set_string(model_fields::kMigrationMode, info.migration_mode)
       .set_string(model_fields::kActiveMigration, "")
       .set_int(model_fields::kMigrationEpoch, 0)
       .set_bool(model_fields::kIsControllerModel, info.is_controller_model);

    auto result = store_->run_transaction({storage::TxnOp::Insert(collections::kModels, uuid, std::move(doc))});
    if (!result.ok()) {
        if (result.is(core::Error::Code::TXN_ABORTED)) {
            return core::AlreadyExistsError("model \"" + uuid + "\" already exists");
        }
        return result.err();
    }
    MODELMIG_INFO("Added model {} ({}) on controller {}", name, uuid, controller_uuid);
    return info;
}

core::Result<storage::Document> ModelRegistry::find_model(const std::string& model_uuid) const {
    auto doc = store_->find(collections::kModels, model_uuid);
    if (!doc.ok() && doc.is(core::Error::Code::NOT_FOUND)) {
        return core::NotFoundError("model \"" + model_uuid + "\" not found");
    }
    return doc;
}

core::Result<ModelInfo> ModelRegistry::decode(const std::string& uuid, const storage::Document& doc) {
    auto life = parse_life(doc.string_or(model_fields::kLife, ""));
    if (!life.ok()) {
        return life.err().annotate("model \"" + uuid + "\"");
    }
    ModelInfo info;
    info.uuid = uuid;
    info.name = doc.string_or(model_fields::kName, "");
    info.owner = doc.string_or(model_fields::kOwner, "");
    info.controller_uuid = doc.string_or(model_fields::kControllerUUID, "");
    info.life = life.value();
    info.migration_mode = doc.string_or(model_fields::kMigrationMode, "");
    info.active_migration = doc.string_or(model_fields::kActiveMigration, "");
    info.migration_epoch = doc.int_or(model_fields::kMigrationEpoch, 0);
    info.is_controller_model = doc.bool_or(model_fields::kIsControllerModel, false);
    return info;
}

core::Result<ModelInfo> ModelRegistry::get(const std::string& model_uuid) const {
    auto doc = find_model(model_uuid);
    if (!doc.ok()) {
        return doc.err();
    }
    return decode(model_uuid, doc.value());
}

core::Result<std::vector<ModelInfo>> ModelRegistry::all() const {
    auto entries = store_->find_all(collections::kModels);
    if (!entries.ok()) {
        return entries.err();
    }
    std::vector<ModelInfo> models;
    for (const auto& [uuid, doc] : entries.value()) {
        auto info = decode(uuid, doc);
        if (!info.ok()) {
            return info.err();
        }
        models.push_back(info.take_value());
    }
    return models;
}

core::Result<void> ModelRegistry::destroy(const std::string& model_uuid) {
    storage::TransactionRunner runner(store_, store_->config().max_txn_attempts);
    return runner.run([&](int) -> core::Result<storage::TxnOps> {
        auto info = get(model_uuid);
        if (!info.ok()) {
            return info.err();
        }
        if (info.value().life != Life::ALIVE) {
            return storage::TxnOps{};
        }
        storage::Document set;
        set.set_string(model_fields::kLife, life_name(Life::DYING));
        storage::TxnOps ops;
        ops.push_back(storage::TxnOp::Update(collections::kModels, model_uuid, std::move(set))
                          .assert_string(model_fields::kLife, life_name(Life::ALIVE)));
        return ops;
    });
}

core::Result<bool> ModelRegistry::is_alive(const std::string& model_uuid) const {
    auto info = get(model_uuid);
    if (!info.ok()) {
        return info.err();
    }
    return info.value().life == Life::ALIVE;
}

core::Result<void> ModelRegistry::set_mode(const std::string& model_uuid, const std::string& mode) {
    storage::Document set;
    set.set_string(model_fields::kMigrationMode, mode);
    auto result = store_->run_transaction({storage::TxnOp::Update(collections::kModels, model_uuid, std::move(set))});
    if (!result.ok() && result.is(core::Error::Code::TXN_ABORTED)) {
        return core::NotFoundError("model \"" + model_uuid + "\" not found");
    }
    return result;
}

core::Result<std::string> ModelRegistry::mode(const std::string& model_uuid) const {
    auto info = get(model_uuid);
    if (!info.ok()) {
        return info.err();
    }
    return info.value().migration_mode;
}

storage::TxnOp ModelRegistry::start_migration_op(const std::string& model_uuid,
                                                 const std::string& migration_id) const {
    storage::Document set;
    set.set_string(model_fields::kActiveMigration, migration_id)
       .set_string(model_fields::kMigrationMode, modes_.exporting);
    storage::TxnOp op = storage::TxnOp::Update(collections::kModels, model_uuid, std::move(set));
    op.assert_string(model_fields::kLife, life_name(Life::ALIVE))
      .assert_string(model_fields::kActiveMigration, "")
      .increment(model_fields::kMigrationEpoch);
    return op;
}

storage::TxnOp ModelRegistry::end_migration_op(const std::string& model_uuid,
                                               const std::string& migration_id,
                                               const std::string& final_mode) const {
    storage::Document set;
    set.set_string(model_fields::kActiveMigration, "")
       .set_string(model_fields::kMigrationMode, final_mode);
    storage::TxnOp op = storage::TxnOp::Update(collections::kModels, model_uuid, std::move(set));
    op.assert_string(model_fields::kActiveMigration, migration_id)
      .increment(model_fields::kMigrationEpoch);
    return op;
}

storage::TxnOp ModelRegistry::keep_mode_op(const std::string& model_uuid,
                                           const std::string& migration_id,
                                           const std::string& mode) const {
    storage::Document set;
    set.set_string(model_fields::kMigrationMode, mode);
    storage::TxnOp op = storage::TxnOp::Update(collections::kModels, model_uuid, std::move(set));
    op.assert_string(model_fields::kActiveMigration, migration_id);
    return op;
}

} // namespace migration
} // namespace modelmig
