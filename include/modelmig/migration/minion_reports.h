#ifndef MODELMIG_MIGRATION_MINION_REPORTS_H_
#define MODELMIG_MIGRATION_MINION_REPORTS_H_

#include <memory>
#include <string>
#include <vector>

#include "modelmig/core/phase.h"
#include "modelmig/core/result.h"
#include "modelmig/core/types.h"
#include "modelmig/migration/topology.h"
#include "modelmig/storage/document_store.h"

namespace modelmig {
namespace migration {

/**
 * @brief Partition of a phase's expected agents by report outcome
 *
 * Every agent that reported is in exactly one of succeeded or failed.
 * unknown holds expected agents that have not reported. All lists are
 * sorted by tag.
 */
struct MinionReports {
    std::string migration_id;
    core::Phase phase = core::Phase::UNKNOWN;
    std::vector<core::Tag> succeeded;
    std::vector<core::Tag> failed;
    std::vector<core::Tag> unknown;
};

/**
 * @brief Records per-phase acknowledgements from migration minions
 *
 * Reports are never rejected for arriving late, only for contradicting an
 * earlier report of the same agent in the same phase.
 */
class MinionReportAggregator {
public:
    MinionReportAggregator(std::shared_ptr<storage::DocumentStore> store,
                           std::shared_ptr<MinionTopology> topology);

    core::Result<void> report(const std::string& migration_id,
                              const core::Tag& agent,
                              core::Phase phase,
                              bool success);

    core::Result<MinionReports> get(const std::string& migration_id,
                                    const std::string& model_uuid,
                                    core::Phase phase) const;

    // "<migration-id>:<PHASE>:<agent-tag>"
    static std::string report_id(const std::string& migration_id, core::Phase phase, const core::Tag& agent);

    // Every report id of (migration, phase) starts with this
    static std::string phase_prefix(const std::string& migration_id, core::Phase phase);

private:
    std::shared_ptr<storage::DocumentStore> store_;
    std::shared_ptr<MinionTopology> topology_;
};

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_MINION_REPORTS_H_
