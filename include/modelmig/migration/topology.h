#ifndef MODELMIG_MIGRATION_TOPOLOGY_H_
#define MODELMIG_MIGRATION_TOPOLOGY_H_

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "modelmig/core/phase.h"
#include "modelmig/core/result.h"
#include "modelmig/core/types.h"

namespace modelmig {
namespace migration {

/**
 * @brief Source of the agents expected to report for a migration phase
 */
class MinionTopology {
public:
    virtual ~MinionTopology() = default;

    virtual core::Result<std::vector<core::Tag>> expected_agents(const std::string& model_uuid,
                                                                 core::Phase phase) const = 0;
};

/**
 * @brief In-memory topology: every registered agent of a model is expected
 * to report in every phase
 */
class StaticTopology : public MinionTopology {
public:
    StaticTopology() = default;

    // Only machine and unit tags name agents
    core::Result<void> add_agent(const std::string& model_uuid, const core::Tag& agent);
    void remove_agent(const std::string& model_uuid, const core::Tag& agent);

    core::Result<std::vector<core::Tag>> expected_agents(const std::string& model_uuid,
                                                         core::Phase phase) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::set<core::Tag>> agents_;
};

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_TOPOLOGY_H_
