#include "watchdog.hpp"

#include "task_store.hpp"
#include "usage_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <unistd.h>

namespace {

bool IsReadWriteDir(const std::filesystem::path &dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && access(dir.c_str(), R_OK | W_OK | X_OK) == 0;
}

} // namespace

// ─────────────────────────────────────
nlohmann::json HealthStatus::ToJson() const {
    return {
        {"timestamp", FormatDateTime(timestamp)},
        {"system_healthy", system_healthy},
        {"api_server", api_server},
        {"file_watcher", file_watcher},
        {"storage_accessible", storage_accessible},
        {"working_directory_accessible", working_directory_accessible},
    };
}

// ─────────────────────────────────────
Watchdog::Watchdog(WatchdogOptions options, std::unique_ptr<SupervisedService> api,
                   std::unique_ptr<SupervisedService> watcher)
    : m_Options(std::move(options)), m_Api(std::move(api)), m_Watcher(std::move(watcher)) {
    if (m_Options.max_failures < 1) {
        m_Options.max_failures = 1;
    }
    for (auto *service : {m_Api.get(), m_Watcher.get()}) {
        if (service && !service->IsSupervised()) {
            spdlog::info("Watchdog: {} has no command configured, it is not supervised",
                         service->Name());
        }
    }
}

// ─────────────────────────────────────
Watchdog::~Watchdog() {
    Stop();
}

// ─────────────────────────────────────
bool Watchdog::EnsureDirectories() {
    bool ok = true;
    for (const auto &dir : m_Options.required_dirs) {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec)) {
            continue;
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            spdlog::error("Watchdog: Failed to create directory {}: {}", dir.string(),
                          ec.message());
            ok = false;
        } else {
            spdlog::info("Watchdog: Created directory {}", dir.string());
        }
    }
    return ok;
}

// ─────────────────────────────────────
bool Watchdog::CheckStorage() {
    for (const auto &dir : m_Options.required_dirs) {
        if (!IsReadWriteDir(dir)) {
            spdlog::debug("Watchdog: {} is missing or not writable", dir.string());
            return false;
        }
    }
    if (!m_Options.task_store_path.empty() && !TaskStore(m_Options.task_store_path).IsAccessible()) {
        spdlog::debug("Watchdog: Task store {} is not accessible",
                      m_Options.task_store_path.string());
        return false;
    }
    if (!m_Options.usage_db_path.empty() && !UsageStore::IsAccessible(m_Options.usage_db_path)) {
        spdlog::debug("Watchdog: Usage store {} is not accessible",
                      m_Options.usage_db_path.string());
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool Watchdog::CheckWorkingDirectory() {
    if (m_Options.working_directory.empty()) {
        return true;
    }
    return IsReadWriteDir(m_Options.working_directory);
}

// ─────────────────────────────────────
bool Watchdog::CheckService(SupervisedService &service) {
    try {
        return service.IsAlive();
    } catch (const std::exception &e) {
        spdlog::error("Watchdog: Liveness check of {} failed: {}", service.Name(), e.what());
        return false;
    }
}

// ─────────────────────────────────────
HealthStatus Watchdog::CheckHealth() {
    HealthStatus status;
    status.timestamp = LocalNow();
    status.api_server = !m_Api || CheckService(*m_Api);
    status.file_watcher = !m_Watcher || CheckService(*m_Watcher);

    try {
        status.storage_accessible = CheckStorage();
    } catch (const std::exception &e) {
        spdlog::error("Watchdog: Storage check failed: {}", e.what());
        status.storage_accessible = false;
    }
    try {
        status.working_directory_accessible = CheckWorkingDirectory();
    } catch (const std::exception &e) {
        spdlog::error("Watchdog: Working directory check failed: {}", e.what());
        status.working_directory_accessible = false;
    }

    status.system_healthy = status.api_server && status.file_watcher &&
                            status.storage_accessible && status.working_directory_accessible;
    return status;
}

// ─────────────────────────────────────
bool Watchdog::StartServices() {
    bool ok = true;
    for (auto *service : {m_Api.get(), m_Watcher.get()}) {
        if (!service || !service->IsSupervised()) {
            continue;
        }
        if (CheckService(*service)) {
            spdlog::debug("Watchdog: {} already running", service->Name());
            continue;
        }
        std::string error;
        if (!service->Start(error)) {
            spdlog::error("Watchdog: Failed to start {}: {}", service->Name(), error);
            ok = false;
        }
    }
    return ok;
}

// ─────────────────────────────────────
void Watchdog::StopServices() {
    for (auto *service : {m_Api.get(), m_Watcher.get()}) {
        if (service && service->IsSupervised()) {
            service->Stop();
        }
    }
}

// ─────────────────────────────────────
bool Watchdog::RestartFailed(const HealthStatus &status) {
    bool ok = true;
    std::vector<SupervisedService *> failed;
    if (m_Api && !status.api_server) {
        failed.push_back(m_Api.get());
    }
    if (m_Watcher && !status.file_watcher) {
        failed.push_back(m_Watcher.get());
    }

    for (auto *service : failed) {
        service->Stop();
    }
    if (!failed.empty() && !Sleep(m_Options.restart_delay)) {
        return false;
    }
    for (auto *service : failed) {
        spdlog::info("Watchdog: Restarting {}", service->Name());
        std::string error;
        if (!service->Start(error)) {
            spdlog::error("Watchdog: Restart of {} failed: {}", service->Name(), error);
            ok = false;
        }
    }
    return ok;
}

// ─────────────────────────────────────
bool Watchdog::FullReset() {
    StopServices();
    if (!Sleep(m_Options.reset_delay)) {
        return false;
    }

    bool ok = EnsureDirectories();

    std::string error;
    if (!m_Options.task_store_path.empty()) {
        TaskStore store(m_Options.task_store_path);
        if (!store.EnsureExists(error)) {
            spdlog::error("Watchdog: Could not recreate task store: {}", error);
            ok = false;
        }
    }
    if (!m_Options.usage_db_path.empty()) {
        try {
            UsageStore usage(m_Options.usage_db_path);
        } catch (const std::exception &e) {
            spdlog::error("Watchdog: Could not recreate usage store: {}", e.what());
            ok = false;
        }
    }

    return StartServices() && ok;
}

// ─────────────────────────────────────
HealthStatus Watchdog::RunCycle() {
    HealthStatus status = CheckHealth();

    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(m_StatusMutex);
        m_LastStatus = status;
        m_ConsecutiveFailures = status.system_healthy ? 0 : m_ConsecutiveFailures + 1;
        failures = m_ConsecutiveFailures;
        m_LastAction = Remediation::NONE;
        if (!status.system_healthy) {
            m_LastAction = failures >= m_Options.max_failures ? Remediation::FULL_RESET
                                                               : Remediation::LOCAL_RESTART;
        }
    }

    const std::string snapshot = status.ToJson().dump();
    if (status.system_healthy) {
        spdlog::info("Watchdog: Health check: {}", snapshot);
    } else {
        spdlog::error("Watchdog: Health check: {}", snapshot);
    }
    Persist(StatusJson());

    if (status.system_healthy) {
        return status;
    }

    if (LastAction() == Remediation::FULL_RESET) {
        spdlog::warn("Watchdog: {} consecutive failures, performing full reset", failures);
        if (!FullReset()) {
            spdlog::error("Watchdog: Full reset did not complete");
        }
    } else {
        spdlog::warn("Watchdog: Consecutive failures: {}/{}", failures, m_Options.max_failures);
        if (!RestartFailed(status)) {
            spdlog::error("Watchdog: Local restart did not complete");
        }
    }
    return status;
}

// ─────────────────────────────────────
void Watchdog::Persist(const nlohmann::json &status) {
    if (m_Options.status_file.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(m_Options.status_file.parent_path(), ec);

    // Readers in other processes only ever see a complete snapshot.
    std::filesystem::path tmp = m_Options.status_file;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("Watchdog: Failed to save health status to {}", tmp.string());
            return;
        }
        file << status.dump(2) << "\n";
        file.flush();
        if (!file) {
            spdlog::error("Watchdog: Short write to {}", tmp.string());
            std::filesystem::remove(tmp, ec);
            return;
        }
    }

    std::filesystem::rename(tmp, m_Options.status_file, ec);
    if (ec) {
        spdlog::error("Watchdog: Failed to replace {}: {}", m_Options.status_file.string(),
                      ec.message());
        std::filesystem::remove(tmp, ec);
    }
}

// ─────────────────────────────────────
int Watchdog::ConsecutiveFailures() const {
    std::lock_guard<std::mutex> lock(m_StatusMutex);
    return m_ConsecutiveFailures;
}

// ─────────────────────────────────────
Remediation Watchdog::LastAction() const {
    std::lock_guard<std::mutex> lock(m_StatusMutex);
    return m_LastAction;
}

// ─────────────────────────────────────
std::optional<HealthStatus> Watchdog::LastStatus() const {
    std::lock_guard<std::mutex> lock(m_StatusMutex);
    return m_LastStatus;
}

// ─────────────────────────────────────
nlohmann::json Watchdog::StatusJson() const {
    std::lock_guard<std::mutex> lock(m_StatusMutex);
    nlohmann::json j = m_LastStatus ? m_LastStatus->ToJson() : nlohmann::json::object();
    j["consecutive_failures"] = m_ConsecutiveFailures;
    j["max_failures"] = m_Options.max_failures;
    j["last_action"] = RemediationName(m_LastAction);
    return j;
}

// ─────────────────────────────────────
bool Watchdog::Sleep(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(m_LoopMutex);
    return !m_LoopCv.wait_for(lock, duration, [this]() { return m_StopRequested; });
}

// ─────────────────────────────────────
void Watchdog::Start() {
    {
        std::lock_guard<std::mutex> lock(m_LoopMutex);
        if (m_Running) {
            return;
        }
        m_Running = true;
        m_StopRequested = false;
    }
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    m_Thread = std::thread([this]() { Run(); });
}

// ─────────────────────────────────────
void Watchdog::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_LoopMutex);
        if (!m_Running) {
            return;
        }
        m_StopRequested = true;
    }
    m_LoopCv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    for (auto *service : {m_Api.get(), m_Watcher.get()}) {
        if (service && service->IsSupervised()) {
            service->StopLaunched();
        }
    }

    std::lock_guard<std::mutex> lock(m_LoopMutex);
    m_Running = false;
    spdlog::info("Watchdog: Stopped");
}

// ─────────────────────────────────────
void Watchdog::Run() {
    spdlog::info("Watchdog: Monitor starting, checking every {} ms",
                 m_Options.check_interval.count());

    if (!EnsureDirectories()) {
        spdlog::warn("Watchdog: Some required directories are missing");
    }
    if (!StartServices()) {
        spdlog::error("Watchdog: Failed to start services during initialization");
    }

    std::unique_lock<std::mutex> lock(m_LoopMutex);
    while (!m_StopRequested) {
        lock.unlock();
        try {
            RunCycle();
        } catch (const std::exception &e) {
            spdlog::error("Watchdog: Error in watchdog loop: {}", e.what());
        }
        lock.lock();
        m_LoopCv.wait_for(lock, m_Options.check_interval, [this]() { return m_StopRequested; });
    }
}
