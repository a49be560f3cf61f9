#include "logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

// ─────────────────────────────────────
LogLevel ParseLogLevel(const std::string &value, LogLevel fallback) {
    if (value == "debug") {
        return LOG_DEBUG;
    }
    if (value == "info") {
        return LOG_INFO;
    }
    if (value == "off") {
        return LOG_OFF;
    }
    return fallback;
}

// ─────────────────────────────────────
void SetLogLevel(LogLevel level) {
    if (level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
void SetupLogging(const std::filesystem::path &logs_dir, LogLevel level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string fileError;
    if (!logs_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logs_dir, ec);
        try {
            constexpr std::size_t kMaxSize = 5 * 1024 * 1024;
            constexpr std::size_t kMaxFiles = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (logs_dir / "sortd.log").string(), kMaxSize, kMaxFiles));
        } catch (const spdlog::spdlog_ex &e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("sortd", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    SetLogLevel(level);
    spdlog::flush_on(spdlog::level::warn);

    if (!fileError.empty()) {
        spdlog::warn("Logging: File logging disabled: {}", fileError);
    }
}
