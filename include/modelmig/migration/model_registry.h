#ifndef MODELMIG_MIGRATION_MODEL_REGISTRY_H_
#define MODELMIG_MIGRATION_MODEL_REGISTRY_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "modelmig/core/config.h"
#include "modelmig/core/result.h"
#include "modelmig/storage/document_store.h"

namespace modelmig {
namespace migration {

enum class Life {
    ALIVE,
    DYING,
    DEAD
};

const char* life_name(Life life);
core::Result<Life> parse_life(const std::string& name);

/**
 * @brief A model record as stored in the "models" collection
 */
struct ModelInfo {
    std::string uuid;
    std::string name;
    std::string owner;
    std::string controller_uuid;
    Life life = Life::ALIVE;
    std::string migration_mode;
    std::string active_migration;   // Empty when no migration is running
    int64_t migration_epoch = 0;    // Bumped whenever a migration starts or ends
    bool is_controller_model = false;
};

/**
 * @brief Model records kept in the document store
 *
 * The active-migration marker and migration mode on a model record are
 * written only in the same transaction as the migration documents they
 * refer to; see start_migration_op() and end_migration_op(). Both ops also
 * bump the migration epoch, so a start followed by an end is never
 * mistaken for no change.
 */
class ModelRegistry {
public:
    ModelRegistry(std::shared_ptr<storage::DocumentStore> store,
                  core::MigrationModes modes = core::MigrationModes::Default());

    /**
     * @brief Adds an alive model in the active mode under a fresh uuid
     */
    core::Result<ModelInfo> add_model(const std::string& name,
                                      const std::string& owner,
                                      const std::string& controller_uuid,
                                      bool is_controller_model = false);

    // As above with a caller-chosen uuid
    core::Result<ModelInfo> add_model_with_uuid(const std::string& uuid,
                                                const std::string& name,
                                                const std::string& owner,
                                                const std::string& controller_uuid,
                                                bool is_controller_model = false);

    core::Result<ModelInfo> get(const std::string& model_uuid) const;
    core::Result<std::vector<ModelInfo>> all() const;

    // Moves an alive model to dying; a no-op for dying or dead models
    core::Result<void> destroy(const std::string& model_uuid);

    core::Result<bool> is_alive(const std::string& model_uuid) const;
    core::Result<void> set_mode(const std::string& model_uuid, const std::string& mode);
    core::Result<std::string> mode(const std::string& model_uuid) const;

    /**
     * @brief Asserts the model is alive with no active migration, then
     * marks `migration_id` active and switches the mode to exporting
     */
    storage::TxnOp start_migration_op(const std::string& model_uuid,
                                      const std::string& migration_id) const;

    /**
     * @brief Asserts `migration_id` is the active one, clears the marker
     * and sets the final mode
     */
    storage::TxnOp end_migration_op(const std::string& model_uuid,
                                    const std::string& migration_id,
                                    const std::string& final_mode) const;

    // Asserts `migration_id` is still active and sets the mode
    storage::TxnOp keep_mode_op(const std::string& model_uuid,
                                const std::string& migration_id,
                                const std::string& mode) const;

    const core::MigrationModes& modes() const { return modes_; }

private:
    std::shared_ptr<storage::DocumentStore> store_;
    core::MigrationModes modes_;

    static core::Result<ModelInfo> decode(const std::string& uuid, const storage::Document& doc);
    core::Result<storage::Document> find_model(const std::string& model_uuid) const;
};

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_MODEL_REGISTRY_H_
