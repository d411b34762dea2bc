#ifndef MODELMIG_MIGRATION_WATCHERS_H_
#define MODELMIG_MIGRATION_WATCHERS_H_

#include <memory>
#include <string>

#include "modelmig/core/phase.h"
#include "modelmig/core/result.h"
#include "modelmig/storage/document_store.h"
#include "modelmig/watcher/notify_watcher.h"

namespace modelmig {
namespace migration {

using WatcherPtr = std::unique_ptr<watcher::NotifyWatcher>;

/**
 * @brief Fires when a migration of the model starts or ends
 *
 * Follows the model's active-migration marker, so intermediate phase
 * changes are not reported.
 */
core::Result<WatcherPtr> watch_model_migration(std::shared_ptr<storage::DocumentStore> store,
                                               const std::string& model_uuid);

/**
 * @brief Fires on any write to a status document of the model's migrations
 */
core::Result<WatcherPtr> watch_migration_status(std::shared_ptr<storage::DocumentStore> store,
                                                const std::string& model_uuid);

/**
 * @brief Fires when a minion reports for (migration_id, phase)
 */
core::Result<WatcherPtr> watch_minion_reports(std::shared_ptr<storage::DocumentStore> store,
                                              const std::string& migration_id,
                                              core::Phase phase);

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_WATCHERS_H_
