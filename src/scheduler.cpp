#include "scheduler.hpp"

#include "config.hpp"
#include "recurrence.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

// ─────────────────────────────────────
Scheduler::Scheduler(std::unique_ptr<TaskStore> store,
                     std::unique_ptr<UsagePatternAnalyzer> analyzer, OrganizeEngine &engine,
                     SchedulerOptions options)
    : m_Store(std::move(store)), m_Analyzer(std::move(analyzer)), m_Engine(engine),
      m_Options(options) {
    std::string error;
    if (!m_Store->Load(m_Tasks, error)) {
        spdlog::error("Scheduler: Could not load tasks from {}: {}", m_Store->Path().string(),
                      error);
        m_Tasks.clear();
    } else {
        spdlog::info("Scheduler: {} task(s) loaded from {}", m_Tasks.size(),
                     m_Store->Path().string());
    }
}

// ─────────────────────────────────────
Scheduler::~Scheduler() {
    Stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
std::vector<Task>::iterator Scheduler::FindLocked(const std::string &id) {
    return std::find_if(m_Tasks.begin(), m_Tasks.end(),
                        [&id](const Task &t) { return t.id == id; });
}

// ─────────────────────────────────────
bool Scheduler::PersistLocked(std::string &error) {
    if (!m_Store->Save(m_Tasks, error)) {
        spdlog::error("Scheduler: Failed to save tasks: {}", error);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void Scheduler::FreezeAdaptiveAnchor(Task &task, DateTime now) {
    if (task.policy != RecurrencePolicy::ADAPTIVE || task.anchor_time) {
        return;
    }
    std::pair<int, int> slot{UsagePatternAnalyzer::kDefaultHour,
                             UsagePatternAnalyzer::kDefaultMinute};
    if (m_Analyzer) {
        slot = m_Analyzer->FindOptimalTime(task.resource_limit);
    } else {
        spdlog::warn("Scheduler: No usage analyzer, adaptive task '{}' uses {:02}:{:02}",
                     task.name, slot.first, slot.second);
    }
    task.anchor_time = CombineDateTime(DateOf(now), std::chrono::hours(slot.first) +
                                                        std::chrono::minutes(slot.second));
}

// ─────────────────────────────────────
bool Scheduler::AddTask(Task &task, std::string &error) {
    const DateTime now = LocalNow();
    if (task.id.empty()) {
        task.id = GenerateTaskId();
    }
    if (!task.created_at) {
        task.created_at = now;
    }
    FreezeAdaptiveAnchor(task, now);

    if (!ValidateTask(task, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_TasksMutex);
    if (FindLocked(task.id) != m_Tasks.end()) {
        error = "task id already exists";
        return false;
    }
    m_Tasks.push_back(task);
    if (!PersistLocked(error)) {
        m_Tasks.pop_back();
        return false;
    }

    auto next = NextRunTime(task, now);
    spdlog::info("Scheduler: Added task '{}' ({}), {} next run {}", task.name, task.id,
                 PolicyName(task.policy), next ? FormatDateTime(*next) : "never");
    return true;
}

// ─────────────────────────────────────
bool Scheduler::UpdateTask(const Task &task, std::string &error) {
    Task updated = task;

    std::lock_guard<std::mutex> lock(m_TasksMutex);
    auto it = FindLocked(task.id);
    if (it == m_Tasks.end()) {
        error = "task not found";
        return false;
    }

    if (!updated.created_at) {
        updated.created_at = it->created_at;
    }
    if (it->last_run) {
        RecordRun(updated, *it->last_run);
    }
    if (updated.policy == RecurrencePolicy::ADAPTIVE && !updated.anchor_time) {
        updated.anchor_time = it->anchor_time;
        FreezeAdaptiveAnchor(updated, LocalNow());
    }

    if (!ValidateTask(updated, error)) {
        return false;
    }

    Task previous = *it;
    *it = updated;
    if (!PersistLocked(error)) {
        *it = previous;
        return false;
    }
    spdlog::info("Scheduler: Updated task '{}' ({})", updated.name, updated.id);
    return true;
}

// ─────────────────────────────────────
bool Scheduler::RemoveTask(const std::string &id, std::string &error) {
    std::lock_guard<std::mutex> lock(m_TasksMutex);
    auto it = FindLocked(id);
    if (it == m_Tasks.end()) {
        error = "task not found";
        return false;
    }

    const std::size_t index = static_cast<std::size_t>(it - m_Tasks.begin());
    Task removed = *it;
    m_Tasks.erase(it);
    if (!PersistLocked(error)) {
        m_Tasks.insert(m_Tasks.begin() + static_cast<std::ptrdiff_t>(index), removed);
        return false;
    }
    m_LastAttempt.erase(id);
    spdlog::info("Scheduler: Removed task '{}' ({})", removed.name, removed.id);
    return true;
}

// ─────────────────────────────────────
std::optional<Task> Scheduler::GetTask(const std::string &id) const {
    std::lock_guard<std::mutex> lock(m_TasksMutex);
    for (const auto &task : m_Tasks) {
        if (task.id == id) {
            return task;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::vector<Task> Scheduler::ListTasks() const {
    std::lock_guard<std::mutex> lock(m_TasksMutex);
    return m_Tasks;
}

// ─────────────────────────────────────
std::vector<Task> Scheduler::DueTasks(DateTime now) const {
    std::vector<Task> due;
    std::lock_guard<std::mutex> lock(m_TasksMutex);
    for (const auto &task : m_Tasks) {
        auto attempt = m_LastAttempt.find(task.id);
        std::optional<DateTime> lastAttempt;
        if (attempt != m_LastAttempt.end()) {
            lastAttempt = attempt->second;
        }
        if (IsDue(task, now, lastAttempt)) {
            due.push_back(task);
        }
    }
    return due;
}

// ─────────────────────────────────────
std::vector<UpcomingRun> Scheduler::UpcomingTasks(std::size_t limit, DateTime now) const {
    std::vector<UpcomingRun> upcoming;
    {
        std::lock_guard<std::mutex> lock(m_TasksMutex);
        for (const auto &task : m_Tasks) {
            auto next = NextRunTime(task, now);
            if (next) {
                upcoming.push_back({task, *next});
            }
        }
    }
    std::stable_sort(upcoming.begin(), upcoming.end(),
                     [](const UpcomingRun &a, const UpcomingRun &b) {
                         return a.next_run < b.next_run;
                     });
    if (upcoming.size() > limit) {
        upcoming.resize(limit);
    }
    return upcoming;
}

// ─────────────────────────────────────
bool Scheduler::Execute(const Task &task, DateTime now, std::string &error) {
    spdlog::info("Scheduler: Running task '{}' ({}) on {}", task.name, task.id, task.target_path);
    {
        std::lock_guard<std::mutex> lock(m_TasksMutex);
        m_LastAttempt[task.id] = now;
    }

    OrganizeRequest request;
    request.target_path = task.target_path;
    request.instruction = task.instruction;
    request.resource_limit = task.resource_limit;

    OrganizeResult result;
    try {
        result = m_Engine.Organize(request);
    } catch (const std::exception &e) {
        result.ok = false;
        result.error = std::string("organize engine threw: ") + e.what();
    }

    if (!result.ok) {
        error = result.error.empty() ? "organize call failed" : result.error;
        spdlog::error("Scheduler: Task '{}' ({}) failed: {}", task.name, task.id, error);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_TasksMutex);
    auto it = FindLocked(task.id);
    if (it == m_Tasks.end()) {
        spdlog::warn("Scheduler: Task {} was removed while it ran", task.id);
        return true;
    }
    RecordRun(*it, now);
    std::string saveError;
    if (!PersistLocked(saveError)) {
        spdlog::warn("Scheduler: last_run of task {} is only kept in memory", task.id);
    }
    spdlog::info("Scheduler: Task '{}' ({}) completed, {} file(s) affected", task.name, task.id,
                 result.files_affected);
    return true;
}

// ─────────────────────────────────────
int Scheduler::RunDueTasks(DateTime now) {
    ReloadIfChanged();

    int succeeded = 0;
    for (const auto &task : DueTasks(now)) {
        std::string error;
        if (Execute(task, now, error)) {
            ++succeeded;
        }
    }
    return succeeded;
}

// ─────────────────────────────────────
bool Scheduler::RunTaskNow(const std::string &id, std::string &error) {
    auto task = GetTask(id);
    if (!task) {
        error = "task not found";
        return false;
    }
    return Execute(*task, LocalNow(), error);
}

// ─────────────────────────────────────
bool Scheduler::CreateCommonTask(const std::string &kind, const std::string &path, Task &created,
                                 std::string &error) {
    const std::chrono::local_days today = DateOf(LocalNow());
    const std::filesystem::path home = HomeDirectory();

    Task task;
    if (kind == "daily_cleanup") {
        task.name = "Daily Cleanup";
        task.target_path = path.empty() ? (home / "Downloads").string() : path;
        task.instruction = "Move all files older than 7 days into an Archive folder. Group files "
                           "by type into Documents, Images, Videos, and Other categories.";
        task.policy = RecurrencePolicy::DAILY;
        task.anchor_time = CombineDateTime(today, std::chrono::hours(2));
        task.resource_limit = 40;
        task.priority = 2;
    } else if (kind == "weekly_organization") {
        task.name = "Weekly Deep Organization";
        task.target_path = path.empty() ? (home / "Documents").string() : path;
        task.instruction = "Perform deep organization of all files. Create content-based "
                           "categories and move files based on their content and type. Rename "
                           "files with inconsistent naming patterns to follow a standard format.";
        task.policy = RecurrencePolicy::WEEKLY;
        task.anchor_time = CombineDateTime(today, std::chrono::hours(3));
        task.days_of_week = {6};
        task.resource_limit = 70;
        task.priority = 3;
    } else if (kind == "monthly_archive") {
        task.name = "Monthly Archiving";
        task.target_path = path.empty() ? home.string() : path;
        task.instruction = "Archive files that haven't been accessed in 3 months. Compress large "
                           "files and folders. Generate a report of disk space usage and cleanup "
                           "recommendations.";
        task.policy = RecurrencePolicy::MONTHLY;
        task.anchor_time = CombineDateTime(today, std::chrono::hours(4));
        task.day_of_month = 1;
        task.resource_limit = 60;
        task.priority = 2;
    } else if (kind == "smart") {
        return CreateAdaptiveTask(
            "Smart Maintenance", path.empty() ? (home / "Documents").string() : path,
            "Organize loose files into appropriate folders based on content and file type. "
            "Remove empty directories. Create logical category structure.",
            created, error);
    } else {
        error = "unknown common task '" + kind + "'";
        return false;
    }

    if (!AddTask(task, error)) {
        return false;
    }
    created = task;
    return true;
}

// ─────────────────────────────────────
bool Scheduler::CreateAdaptiveTask(const std::string &name, const std::string &path,
                                   const std::string &instruction, Task &created,
                                   std::string &error) {
    Task task;
    task.name = name;
    task.target_path = path;
    task.instruction = instruction;
    task.policy = RecurrencePolicy::ADAPTIVE;
    task.resource_limit = 30;
    task.priority = 1;
    if (!AddTask(task, error)) {
        return false;
    }
    created = task;
    return true;
}

// ─────────────────────────────────────
bool Scheduler::ReloadIfChanged() {
    std::lock_guard<std::mutex> lock(m_TasksMutex);
    if (!m_Store->ChangedOnDisk()) {
        return false;
    }

    std::vector<Task> loaded;
    std::string error;
    if (!m_Store->Load(loaded, error)) {
        spdlog::error("Scheduler: Task file changed but could not be reloaded: {}", error);
        return false;
    }
    m_Tasks = std::move(loaded);
    spdlog::info("Scheduler: Task file changed on disk, reloaded {} task(s)", m_Tasks.size());
    return true;
}

// ─────────────────────────────────────
void Scheduler::Start() {
    {
        std::lock_guard<std::mutex> lock(m_LoopMutex);
        if (m_Running) {
            return;
        }
        m_Running = true;
    }
    // A loop left behind by a timed out Stop still holds its last task.
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    {
        std::lock_guard<std::mutex> lock(m_LoopMutex);
        m_StopRequested = false;
        m_LoopExited = false;
    }
    m_Thread = std::thread([this]() { Run(); });

    if (m_Analyzer) {
        m_Analyzer->StartCollecting();
    }
    spdlog::info("Scheduler: Started");
}

// ─────────────────────────────────────
void Scheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_LoopMutex);
        if (!m_Running) {
            return;
        }
        m_StopRequested = true;
    }
    m_LoopCv.notify_all();

    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(m_LoopMutex);
        exited =
            m_LoopCv.wait_for(lock, m_Options.stop_timeout, [this]() { return m_LoopExited; });
    }
    if (exited) {
        if (m_Thread.joinable()) {
            m_Thread.join();
        }
    } else {
        spdlog::warn("Scheduler: Loop did not stop within {} ms, leaving the running task to "
                     "finish on its own",
                     m_Options.stop_timeout.count());
    }

    if (m_Analyzer) {
        m_Analyzer->StopCollecting();
    }

    std::lock_guard<std::mutex> lock(m_LoopMutex);
    m_Running = false;
    spdlog::info("Scheduler: Stopped");
}

// ─────────────────────────────────────
bool Scheduler::IsRunning() const {
    std::lock_guard<std::mutex> lock(m_LoopMutex);
    return m_Running;
}

// ─────────────────────────────────────
void Scheduler::Run() {
    spdlog::info("Scheduler: Polling every {} ms", m_Options.poll_interval.count());

    std::unique_lock<std::mutex> lock(m_LoopMutex);
    while (!m_StopRequested) {
        lock.unlock();
        try {
            RunDueTasks(LocalNow());
        } catch (const std::exception &e) {
            spdlog::error("Scheduler: Error in scheduler loop: {}", e.what());
        }
        lock.lock();
        m_LoopCv.wait_for(lock, m_Options.poll_interval, [this]() { return m_StopRequested; });
    }
    m_LoopExited = true;
    lock.unlock();
    m_LoopCv.notify_all();
}
