#include "modelmig/migration/topology.h"

namespace modelmig {
namespace migration {

core::Result<void> StaticTopology::add_agent(const std::string& model_uuid, const core::Tag& agent) {
    bool is_agent = agent.kind() == core::Tag::Kind::MACHINE || agent.kind() == core::Tag::Kind::UNIT;
    if (!is_agent || !agent.is_valid()) {
        return core::NotValidError("agent tag \"" + agent.to_string() + "\" not valid");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    agents_[model_uuid].insert(agent);
    return core::Result<void>();
}

void StaticTopology::remove_agent(const std::string& model_uuid, const core::Tag& agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(model_uuid);
    if (it == agents_.end()) {
        return;
    }
    it->second.erase(agent);
    if (it->second.empty()) {
        agents_.erase(it);
    }
}

core::Result<std::vector<core::Tag>> StaticTopology::expected_agents(const std::string& model_uuid,
                                                                     core::Phase /*phase*/) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(model_uuid);
    if (it == agents_.end()) {
        return std::vector<core::Tag>{};
    }
    return std::vector<core::Tag>(it->second.begin(), it->second.end());
}

} // namespace migration
} // namespace modelmig
