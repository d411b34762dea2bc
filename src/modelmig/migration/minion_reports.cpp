#include "modelmig/migration/minion_reports.h"
#include <algorithm>
#include <set>
#include "modelmig/common/logger.h"
#include "modelmig/migration/collections.h"

namespace modelmig {
namespace migration {

MinionReportAggregator::MinionReportAggregator(std::shared_ptr<storage::DocumentStore> store,
                                               std::shared_ptr<MinionTopology> topology)
    : store_(std::move(store)), topology_(std::move(topology)) {
}

std::string MinionReportAggregator::phase_prefix(const std::string& migration_id, core::Phase phase) {
    return migration_id + ":" + core::phase_name(phase) + ":";
}

std::string MinionReportAggregator::report_id(const std::string& migration_id,
                                              core::Phase phase,
                                              const core::Tag& agent) {
    return phase_prefix(migration_id, phase) + agent.to_string();
}

core::Result<void> MinionReportAggregator::report(const std::string& migration_id,
                                                  const core::Tag& agent,
                                                  core::Phase phase,
                                                  bool success) {
    if (phase == core::Phase::UNKNOWN || phase == core::Phase::NONE) {
        return core::NotValidError(std::string("phase ") + core::phase_name(phase) + " not valid");
    }
    if (agent.empty()) {
        return core::NotValidError("empty agent tag not valid");
    }

    std::string id = report_id(migration_id, phase, agent);
    storage::Document doc;
    doc.set_string(report_fields::kMigrationId, migration_id)
       .set_string(report_fields::kPhase, core::phase_name(phase))
       .set_string(report_fields::kEntityKey, agent.to_string())
       .set_bool(report_fields::kSuccess, success);

    auto result = store_->run_transaction({storage::TxnOp::Insert(collections::kMinionSync, id, std::move(doc))});
    if (result.ok()) {
        MODELMIG_DEBUG("Minion report {} success={}", id, success);
        return result;
    }
    if (!result.is(core::Error::Code::TXN_ABORTED)) {
        return result.err().annotate("cannot record minion report " + id);
    }

    // A report already exists; it must agree with this one
    auto existing = store_->find(collections::kMinionSync, id);
    if (!existing.ok()) {
        return existing.err().annotate("cannot read minion report " + id);
    }
    auto previous = existing.value().get_bool(report_fields::kSuccess);
    if (previous && *previous == success) {
        return core::Result<void>();
    }
    return core::ReportConflictError("conflicting reports received for " + migration_id + "/" +
                                     core::phase_name(phase) + "/" + agent.to_string());
}

core::Result<MinionReports> MinionReportAggregator::get(const std::string& migration_id,
                                                        const std::string& model_uuid,
                                                        core::Phase phase) const {
    std::string prefix = phase_prefix(migration_id, phase);
    auto docs = store_->find_all(collections::kMinionSync,
                                 [&prefix](const std::string& id, const storage::Document&) {
                                     return id.compare(0, prefix.size(), prefix) == 0;
                                 });
    if (!docs.ok()) {
        return docs.err().annotate("cannot read minion reports");
    }

    MinionReports reports;
    reports.migration_id = migration_id;
    reports.phase = phase;

    std::set<core::Tag> reported;
    for (const auto& [id, doc] : docs.value()) {
        auto tag = core::Tag::parse(doc.string_or(report_fields::kEntityKey, ""));
        if (!tag.ok()) {
            return tag.err().annotate("minion report " + id);
        }
        if (doc.bool_or(report_fields::kSuccess, false)) {
            reports.succeeded.push_back(tag.value());
        } else {
            reports.failed.push_back(tag.value());
        }
        reported.insert(tag.value());
    }

    auto expected = topology_->expected_agents(model_uuid, phase);
    if (!expected.ok()) {
        return expected.err().annotate("cannot determine expected agents");
    }
    for (const auto& agent : expected.value()) {
        if (reported.count(agent) == 0) {
            reports.unknown.push_back(agent);
        }
    }

    std::sort(reports.succeeded.begin(), reports.succeeded.end());
    std::sort(reports.failed.begin(), reports.failed.end());
    std::sort(reports.unknown.begin(), reports.unknown.end());
    return reports;
}

} // namespace migration
} // namespace modelmig
