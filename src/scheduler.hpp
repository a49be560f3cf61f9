#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "organizer.hpp"
#include "task.hpp"
#include "task_store.hpp"
#include "usage_analyzer.hpp"

struct SchedulerOptions {
    std::chrono::milliseconds poll_interval = std::chrono::seconds(10);
    std::chrono::milliseconds stop_timeout = std::chrono::seconds(5);
};

struct UpcomingRun {
    Task task;
    DateTime next_run;
};

class Scheduler {
  public:
    // `analyzer` may be null; adaptive tasks then fall back to the analyzer's default time.
    Scheduler(std::unique_ptr<TaskStore> store, std::unique_ptr<UsagePatternAnalyzer> analyzer,
              OrganizeEngine &engine, SchedulerOptions options = {});
    ~Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    // CRUD. All of them write the whole collection back to the store.
    bool AddTask(Task &task, std::string &error);
    bool UpdateTask(const Task &task, std::string &error);
    bool RemoveTask(const std::string &id, std::string &error);
    std::optional<Task> GetTask(const std::string &id) const;
    std::vector<Task> ListTasks() const;

    std::vector<Task> DueTasks(DateTime now) const;
    std::vector<UpcomingRun> UpcomingTasks(std::size_t limit, DateTime now) const;

    // One loop tick: reload if needed, then run every due task in collection order.
    // Returns the number of tasks that ran successfully.
    int RunDueTasks(DateTime now);
    bool RunTaskNow(const std::string &id, std::string &error);

    // Presets: daily_cleanup, weekly_organization, monthly_archive, smart.
    bool CreateCommonTask(const std::string &kind, const std::string &path, Task &created,
                          std::string &error);
    bool CreateAdaptiveTask(const std::string &name, const std::string &path,
                            const std::string &instruction, Task &created, std::string &error);

    bool ReloadIfChanged();

    void Start();
    void Stop();
    bool IsRunning() const;

    UsagePatternAnalyzer *Analyzer() {
        return m_Analyzer.get();
    }

  private:
    void Run();
    bool Execute(const Task &task, DateTime now, std::string &error);
    bool PersistLocked(std::string &error);
    std::vector<Task>::iterator FindLocked(const std::string &id);
    void FreezeAdaptiveAnchor(Task &task, DateTime now);

    std::unique_ptr<TaskStore> m_Store;
    std::unique_ptr<UsagePatternAnalyzer> m_Analyzer;
    OrganizeEngine &m_Engine;
    SchedulerOptions m_Options;

    mutable std::mutex m_TasksMutex;
    std::vector<Task> m_Tasks;
    // task id -> when it last ran, successful or not. Memory only.
    std::map<std::string, DateTime> m_LastAttempt;

    mutable std::mutex m_LoopMutex;
    std::condition_variable m_LoopCv;
    bool m_Running = false;
    bool m_StopRequested = false;
    bool m_LoopExited = true;
    std::thread m_Thread;
};
