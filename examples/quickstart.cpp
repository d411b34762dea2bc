#include "modelmig/common/logger.h"
#include "modelmig/migration/coordinator.h"
#include <iostream>

using namespace modelmig;

int main() {
    std::cout << "=== Model Migration Quick Start ===" << std::endl;
    auto logging = common::Logger::Init();
    if (!logging.ok()) {
        std::cerr << logging.error() << std::endl;
        return 1;
    }

    core::CoordinatorConfig config = core::CoordinatorConfig::Default();
    config.store.data_dir = "./modelmig_data";
    std::cout << "Opening coordinator with data_dir: " << config.store.data_dir << std::endl;

    auto topology = std::make_shared<migration::StaticTopology>();
    auto opened = migration::MigrationCoordinator::Open(config, topology);
    if (!opened.ok()) {
        std::cerr << "Open failed: " << opened.error() << std::endl;
        return 1;
    }
    auto coordinator = opened.take_value();

    // Register a model hosted by this controller, with two agents
    auto model = coordinator->models().add_model("web", "admin", core::new_uuid());
    if (!model.ok()) {
        std::cerr << "Adding model failed: " << model.error() << std::endl;
        return 1;
    }
    const std::string uuid = model.value().uuid;
    auto machine = topology->add_agent(uuid, core::Tag::machine("0"));
    auto unit = topology->add_agent(uuid, core::Tag::unit("web/0"));
    if (!machine.ok() || !unit.ok()) {
        std::cerr << "Adding agents failed" << std::endl;
        return 1;
    }
    std::cout << "Model " << uuid << " added" << std::endl;

    core::MigrationSpec spec;
    spec.initiated_by = core::Tag::user("admin");
    spec.target_info.controller_tag = core::Tag::controller(core::new_uuid());
    spec.target_info.addrs = {"10.0.0.2:17070"};
    spec.target_info.ca_cert = "-----BEGIN CERTIFICATE-----";
    spec.target_info.auth_tag = core::Tag::user("admin");
    spec.target_info.password = "secret";

    auto created = coordinator->create(uuid, spec);
    if (!created.ok()) {
        std::cerr << "Create failed: " << created.error() << std::endl;
        return 1;
    }
    auto mig = created.take_value();
    std::cout << "Migration " << mig->id() << " started in " << core::phase_name(mig->phase()) << std::endl;

    // Walk the success branch, collecting minion acknowledgements on the way
    const core::Phase phases[] = {
        core::Phase::READONLY, core::Phase::PRECHECK, core::Phase::IMPORT, core::Phase::VALIDATION,
        core::Phase::SUCCESS, core::Phase::LOGTRANSFER, core::Phase::REAP, core::Phase::DONE,
    };
    for (auto phase : phases) {
        for (const auto& agent : {core::Tag::machine("0"), core::Tag::unit("web/0")}) {
            auto reported = mig->minion_report(agent, mig->phase(), true);
            if (!reported.ok()) {
                std::cerr << "Report failed: " << reported.error() << std::endl;
                return 1;
            }
        }
        auto reports = mig->get_minion_reports();
        if (reports.ok()) {
            std::cout << "  " << core::phase_name(mig->phase()) << ": "
                      << reports.value().succeeded.size() << " succeeded, "
                      << reports.value().unknown.size() << " pending" << std::endl;
        }

        auto result = mig->set_phase(phase);
        if (!result.ok()) {
            std::cerr << "Phase change failed: " << result.error() << std::endl;
            return 1;
        }
    }

    auto mode = coordinator->models().mode(uuid);
    std::cout << "Migration finished in " << core::phase_name(mig->phase())
              << ", model mode: " << (mode.ok() ? mode.value() : mode.error()) << std::endl;

    auto closed = coordinator->store()->close();
    if (!closed.ok()) {
        std::cerr << "Close failed: " << closed.error() << std::endl;
        return 1;
    }
    std::cout << "Quick start complete" << std::endl;
    return 0;
}
