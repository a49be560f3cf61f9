#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "organizer.hpp"
#include "process.hpp"
#include "scheduler.hpp"
#include "usage_analyzer.hpp"
#include "watchdog.hpp"

struct Config {
    std::filesystem::path base_dir;
    std::filesystem::path data_dir;
    std::filesystem::path logs_dir;
    std::filesystem::path safe_path;
    LogLevel log_level = LOG_INFO;

    HttpOrganizerOptions organizer;
    SchedulerOptions scheduler;
    AnalyzerOptions usage;

    std::chrono::milliseconds watchdog_interval = std::chrono::seconds(30);
    int max_failures = 5;
    ServiceSpec api_server;
    ServiceSpec file_watcher;

    std::string status_host = "127.0.0.1";
    int status_port = 8079;

    std::filesystem::path TaskFile() const {
        return data_dir / "scheduled_tasks.json";
    }
    std::filesystem::path UsageDatabase() const {
        return data_dir / "scheduler.db";
    }
    std::filesystem::path WatchdogStatusFile() const {
        return data_dir / "watchdog_status.json";
    }
    std::filesystem::path LogFile() const {
        return logs_dir / "sortd.log";
    }
};

std::filesystem::path HomeDirectory();
std::string ExpandUser(const std::string &path);

// $XDG_CONFIG_HOME/sortd/config.json, else ~/.config/sortd/config.json
std::filesystem::path DefaultConfigPath();

nlohmann::json DefaultConfigJson();

// Defaults, then the file (when it exists), then SORTD_* environment variables.
// Throws std::runtime_error when the file is not a JSON object, or when an explicitly
// named file does not exist.
Config LoadConfig(const std::filesystem::path &file);
Config ConfigFromJson(const nlohmann::json &j);

std::vector<std::filesystem::path> RequiredDirectories(const Config &config);
bool EnsureDirectories(const Config &config, std::string &error);

WatchdogOptions MakeWatchdogOptions(const Config &config);
