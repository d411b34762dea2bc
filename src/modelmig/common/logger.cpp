#include "modelmig/common/logger.h"
#include <memory>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace modelmig {
namespace common {

core::Result<void> Logger::Init(const core::LogConfig& config) {
    auto level = ParseLevel(config.level);
    if (!level.ok()) {
        return level.err().annotate("log initialization failed");
    }
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
        }
        auto logger = std::make_shared<spdlog::logger>(kName, sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(level.value());
    } catch (const spdlog::spdlog_ex& ex) {
        return core::InternalError(std::string("log initialization failed: ") + ex.what());
    }
    return core::Result<void>();
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

core::Result<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return core::NotValidError("log level \"" + name + "\" not valid");
    }
    return level;
}

} // namespace common
} // namespace modelmig
