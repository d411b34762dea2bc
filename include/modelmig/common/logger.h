#ifndef MODELMIG_COMMON_LOGGER_H_
#define MODELMIG_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include "modelmig/core/config.h"
#include "modelmig/core/result.h"

namespace modelmig {
namespace common {

class Logger {
public:
    static constexpr const char* kName = "modelmig";

    /**
     * @brief Installs the default logger: a colour console sink plus a file
     * sink when config.file is set. Calling it again replaces the logger.
     */
    static core::Result<void> Init(const core::LogConfig& config = core::LogConfig::Default());
    static void SetLevel(spdlog::level::level_enum level);

    // NOT_VALID for anything but the names listed on LogConfig::level
    static core::Result<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace modelmig

// Macros for convenient logging
#define MODELMIG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MODELMIG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MODELMIG_INFO(...)  spdlog::info(__VA_ARGS__)
#define MODELMIG_WARN(...)  spdlog::warn(__VA_ARGS__)
#define MODELMIG_ERROR(...) spdlog::error(__VA_ARGS__)
#define MODELMIG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // MODELMIG_COMMON_LOGGER_H_
