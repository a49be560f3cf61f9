#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "scheduler.hpp"
#include "usage_store.hpp"

namespace httplib {
class Server;
}

nlohmann::json UpcomingToJson(const std::vector<UpcomingRun> &runs);
nlohmann::json UsageReportToJson(const UsageReport &report);

// HTTP view of a running scheduler, plus the last snapshot the watchdog wrote.
class StatusServer {
  public:
    StatusServer(Scheduler &scheduler, std::filesystem::path watchdog_status_file);
    ~StatusServer();

    StatusServer(const StatusServer &) = delete;
    StatusServer &operator=(const StatusServer &) = delete;

    bool Start(const std::string &host, int port, std::string &error);
    void Stop();

  private:
    void RegisterRoutes();

    Scheduler &m_Scheduler;
    std::filesystem::path m_WatchdogStatusFile;
    std::unique_ptr<httplib::Server> m_Server;
    std::thread m_Thread;
};
