#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <vector>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> g_logger;

        constexpr const char* kLoggerName = "backcast";
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr std::size_t kMaxFileBytes = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        std::optional<spdlog::level::level_enum> envLevel() {
            const char* value = std::getenv("SPDLOG_LEVEL");
            if (!value || !*value) {
                return std::nullopt;
            }
            return level_from_string(value);
        }

        // logs/<base>_YYYYmmdd_HHMMSSZ.log, or the working directory when logs/ cannot be created
        std::string logFilePath(const std::string& base_name) {
            std::filesystem::path dir("logs");
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                std::cerr << "[backcast] cannot create log directory '" << dir.string() << "': "
                          << ec.message() << ", logging to the working directory" << std::endl;
                dir = ".";
            }

            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            gmtime_r(&now, &utc_tm);
            char stamp[32];
            std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%SZ", &utc_tm);
            return (dir / (base_name + "_" + stamp + ".log")).string();
        }

        std::shared_ptr<spdlog::logger> consoleOnlyLogger() {
            if (auto existing = spdlog::get(kLoggerName)) {
                return existing;
            }
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_pattern(kPattern);
            auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
            // Quiet by default when embedded; SPDLOG_LEVEL opens it up
            logger->set_level(envLevel().value_or(spdlog::level::warn));
            spdlog::register_logger(logger);
            return logger;
        }

    } // namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        if (auto level = envLevel()) {
            console_level = *level;
            file_level = *level;
        }

        try {
            std::string file_path = logFilePath(base_log_filename);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, kMaxFileBytes, kMaxFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kPattern);

            // A console-only logger may already be registered if something logged first
            spdlog::drop(kLoggerName);
            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
            g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            g_logger->set_level(std::min(console_level, file_level));
            g_logger->flush_on(spdlog::level::err);
            spdlog::register_logger(g_logger);
            spdlog::set_default_logger(g_logger);

            g_logger->info("Logging to console ({}) and {} ({})",
                           spdlog::level::to_string_view(console_level), file_path,
                           spdlog::level::to_string_view(file_level));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[backcast] log initialization failed, console only: " << ex.what() << std::endl;
            g_logger = consoleOnlyLogger();
            g_logger->set_level(console_level);
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!g_logger) {
            g_logger = consoleOnlyLogger();
        }
        return g_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string name(level_str);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "warning") return spdlog::level::warn;
        if (name == "error") return spdlog::level::err;
        if (name == "crit") return spdlog::level::critical;

        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            std::cerr << "[backcast] unknown log level '" << level_str << "', using info" << std::endl;
            return spdlog::level::info;
        }
        return level;
    }

} // namespace logging
} // namespace core
