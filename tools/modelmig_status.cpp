#include <iomanip>
#include <iostream>
#include <string>

#include "modelmig/common/logger.h"
#include "modelmig/config.h"
#include "modelmig/migration/coordinator.h"

using namespace modelmig;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "modelmig_status " << MODELMIG_VERSION << std::endl;
    std::cerr << "Usage: " << argv0 << " <data_dir> [--compact] [--log-level=<level>]" << std::endl;
}

std::string format_time(core::Timestamp ts) {
    return ts == 0 ? std::string("-") : std::to_string(ts);
}

} // namespace

// Prints every model in a coordinator journal with its latest migration
int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    bool compact = false;
    core::LogConfig log_config;
    log_config.level = "warn";
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--compact") {
            compact = true;
        } else if (arg.rfind("--log-level=", 0) == 0) {
            log_config.level = arg.substr(std::string("--log-level=").size());
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    auto logging = common::Logger::Init(log_config);
    if (!logging.ok()) {
        std::cerr << logging.error() << std::endl;
        return 2;
    }

    core::CoordinatorConfig config = core::CoordinatorConfig::Default();
    config.store = core::StoreConfig::Persistent(argv[1]);
    auto opened = migration::MigrationCoordinator::Open(config, std::make_shared<migration::StaticTopology>());
    if (!opened.ok()) {
        std::cerr << "Cannot open " << argv[1] << ": " << opened.error() << std::endl;
        return 1;
    }
    auto coordinator = opened.take_value();

    auto models = coordinator->models().all();
    if (!models.ok()) {
        std::cerr << "Cannot list models: " << models.error() << std::endl;
        return 1;
    }

    std::cout << std::left << std::setw(38) << "MODEL" << std::setw(12) << "MODE"
              << std::setw(8) << "ATTEMPT" << std::setw(12) << "PHASE"
              << std::setw(16) << "STARTED" << std::setw(16) << "ENDED" << "MESSAGE" << std::endl;
    for (const auto& model : models.value()) {
        std::cout << std::left << std::setw(38) << model.uuid << std::setw(12) << model.migration_mode;
        auto latest = coordinator->latest_for_model(model.uuid);
        if (!latest.ok()) {
            if (!latest.is(core::Error::Code::NOT_FOUND)) {
                std::cout << latest.error() << std::endl;
                continue;
            }
            std::cout << std::setw(8) << "-" << std::setw(12) << "NONE" << std::endl;
            continue;
        }
        const auto& mig = *latest.value();
        std::cout << std::setw(8) << mig.attempt() << std::setw(12) << core::phase_name(mig.phase())
                  << std::setw(16) << format_time(mig.start_time())
                  << std::setw(16) << format_time(mig.end_time())
                  << mig.status_message() << std::endl;
    }

    if (compact) {
        auto result = coordinator->store()->compact();
        if (!result.ok()) {
            std::cerr << "Compaction failed: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Journal compacted at revision " << coordinator->store()->revision() << std::endl;
    }

    auto closed = coordinator->store()->close();
    if (!closed.ok()) {
        std::cerr << "Close failed: " << closed.error() << std::endl;
        return 1;
    }
    return 0;
}
