#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Console plus rotating file under logs/. Applications call this once;
    // SPDLOG_LEVEL, when set, overrides both levels.
    void initialize(const std::string& base_log_filename = "backcast",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Shared "backcast" logger. Without initialize() this is a console-only
    // logger at warn (or SPDLOG_LEVEL).
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace".."critical", "warning", "off"; anything else maps to info
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
