#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "common.hpp"
#include "process.hpp"

struct HealthStatus {
    DateTime timestamp{};
    bool system_healthy = false;
    bool api_server = false;
    bool file_watcher = false;
    bool storage_accessible = false;
    bool working_directory_accessible = false;

    nlohmann::json ToJson() const;
};

struct WatchdogOptions {
    std::chrono::milliseconds check_interval = std::chrono::seconds(30);
    int max_failures = 5;
    std::chrono::milliseconds restart_delay = std::chrono::seconds(1);
    std::chrono::milliseconds reset_delay = std::chrono::seconds(2);
    std::vector<std::filesystem::path> required_dirs;
    std::filesystem::path working_directory;
    std::filesystem::path task_store_path;
    std::filesystem::path usage_db_path;
    std::filesystem::path status_file; // not written when empty
};

class Watchdog {
  public:
    Watchdog(WatchdogOptions options, std::unique_ptr<SupervisedService> api,
             std::unique_ptr<SupervisedService> watcher);
    ~Watchdog();

    Watchdog(const Watchdog &) = delete;
    Watchdog &operator=(const Watchdog &) = delete;

    HealthStatus CheckHealth();

    // One check plus whatever remediation the failure count calls for.
    HealthStatus RunCycle();

    bool StartServices();
    void StopServices();
    bool EnsureDirectories();

    void Start();
    void Stop();

    int ConsecutiveFailures() const;
    Remediation LastAction() const;
    std::optional<HealthStatus> LastStatus() const;
    nlohmann::json StatusJson() const;

  private:
    void Run();
    bool Sleep(std::chrono::milliseconds duration);
    bool CheckStorage();
    bool CheckWorkingDirectory();
    bool CheckService(SupervisedService &service);
    bool RestartFailed(const HealthStatus &status);
    bool FullReset();
    void Persist(const nlohmann::json &status);

    WatchdogOptions m_Options;
    std::unique_ptr<SupervisedService> m_Api;
    std::unique_ptr<SupervisedService> m_Watcher;

    mutable std::mutex m_StatusMutex;
    int m_ConsecutiveFailures = 0;
    Remediation m_LastAction = Remediation::NONE;
    std::optional<HealthStatus> m_LastStatus;

    std::mutex m_LoopMutex;
    std::condition_variable m_LoopCv;
    bool m_Running = false;
    bool m_StopRequested = false;
    std::thread m_Thread;
};
