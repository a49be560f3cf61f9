#include <catch2/catch.hpp>

#include "config.hpp"
#include "scheduler.hpp"
#include "test_helpers.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace std::chrono;

namespace {

class FakeEngine : public OrganizeEngine {
  public:
    enum class Mode { SUCCEED, FAIL, THROW };

    OrganizeResult Organize(const OrganizeRequest &request) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Requests.push_back(request);
        if (mode == Mode::THROW) {
            throw std::runtime_error("connection refused");
        }
        OrganizeResult result;
        result.ok = mode == Mode::SUCCEED;
        result.files_affected = result.ok ? 4 : 0;
        if (!result.ok) {
            result.error = "HTTP 500";
        }
        return result;
    }

    std::vector<OrganizeRequest> Requests() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Requests;
    }

    Mode mode = Mode::SUCCEED;

  private:
    std::mutex m_Mutex;
    std::vector<OrganizeRequest> m_Requests;
};

// Holds every call until Open().
class GateEngine : public OrganizeEngine {
  public:
    OrganizeResult Organize(const OrganizeRequest &) override {
        std::unique_lock<std::mutex> lock(m_Mutex);
        m_Entered = true;
        m_Cv.notify_all();
        m_Cv.wait(lock, [this]() { return m_Open; });
        return OrganizeResult{true, 1, ""};
    }

    bool WaitEntered(milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        return m_Cv.wait_for(lock, timeout, [this]() { return m_Entered; });
    }

    void Open() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Open = true;
        m_Cv.notify_all();
    }

  private:
    std::mutex m_Mutex;
    std::condition_variable m_Cv;
    bool m_Entered = false;
    bool m_Open = false;
};

struct OpenOnExit {
    GateEngine &engine;
    ~OpenOnExit() {
        engine.Open();
    }
};

class IdleProbe : public LoadProbe {
  public:
    std::optional<LoadReading> Read(std::string &) override {
        return LoadReading{};
    }
};

Task DailyTask(const std::string &id, int hour) {
    Task task;
    task.id = id;
    task.name = "daily " + id;
    task.target_path = "/data/" + id;
    task.instruction = "sort";
    task.policy = RecurrencePolicy::DAILY;
    task.anchor_time = MakeDateTime(2025, 1, 1, hour, 0);
    task.created_at = MakeDateTime(2025, 3, 1, 12, 0);
    return task;
}

std::unique_ptr<Scheduler> MakeScheduler(const TempDir &dir, FakeEngine &engine,
                                         std::unique_ptr<UsagePatternAnalyzer> analyzer = nullptr,
                                         SchedulerOptions options = {}) {
    return std::make_unique<Scheduler>(
        std::make_unique<TaskStore>(dir / "data" / "scheduled_tasks.json"), std::move(analyzer),
        engine, options);
}

std::vector<Task> LoadFromDisk(const TempDir &dir) {
    std::vector<Task> tasks;
    std::string error;
    REQUIRE(TaskStore(dir / "data" / "scheduled_tasks.json").Load(tasks, error));
    return tasks;
}

} // namespace

TEST_CASE("Adding tasks persists them", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;

    Task task = DailyTask("", 2);
    task.created_at.reset();
    REQUIRE(scheduler->AddTask(task, error));
    CHECK_FALSE(task.id.empty());
    CHECK(task.created_at.has_value());

    auto onDisk = LoadFromDisk(dir);
    REQUIRE(onDisk.size() == 1);
    CHECK(onDisk[0] == task);
    CHECK(scheduler->GetTask(task.id) == task);

    SECTION("duplicate ids are rejected") {
        Task dup = DailyTask(task.id, 5);
        CHECK_FALSE(scheduler->AddTask(dup, error));
        CHECK(error == "task id already exists");
        CHECK(scheduler->ListTasks().size() == 1);
    }

    SECTION("invalid tasks are rejected and not stored") {
        Task bad = DailyTask("bad", 2);
        bad.resource_limit = 150;
        CHECK_FALSE(scheduler->AddTask(bad, error));
        CHECK_FALSE(error.empty());
        CHECK(LoadFromDisk(dir).size() == 1);
    }

    SECTION("a new scheduler sees the same tasks") {
        auto reopened = MakeScheduler(dir, engine);
        CHECK(reopened->ListTasks() == scheduler->ListTasks());
    }
}

TEST_CASE("Updating and removing need a known id", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;

    Task task = DailyTask("a", 2);
    REQUIRE(scheduler->AddTask(task, error));

    CHECK_FALSE(scheduler->UpdateTask(DailyTask("ghost", 2), error));
    CHECK(error == "task not found");
    CHECK_FALSE(scheduler->RemoveTask("ghost", error));
    CHECK(error == "task not found");

    SECTION("update keeps creation time and run history") {
        REQUIRE(scheduler->RunTaskNow("a", error));
        const auto lastRun = scheduler->GetTask("a")->last_run;
        REQUIRE(lastRun.has_value());

        Task changed = DailyTask("a", 6);
        changed.created_at.reset();
        changed.instruction = "sort harder";
        REQUIRE(scheduler->UpdateTask(changed, error));

        auto stored = scheduler->GetTask("a");
        REQUIRE(stored.has_value());
        CHECK(stored->instruction == "sort harder");
        CHECK(stored->created_at == task.created_at);
        CHECK(stored->last_run == lastRun);
        CHECK(LoadFromDisk(dir)[0] == *stored);
    }

    SECTION("an invalid update leaves the task alone") {
        Task changed = DailyTask("a", 6);
        changed.policy = RecurrencePolicy::WEEKLY;
        CHECK_FALSE(scheduler->UpdateTask(changed, error));
        CHECK(scheduler->GetTask("a") == task);
    }

    SECTION("remove drops it from memory and disk") {
        REQUIRE(scheduler->RemoveTask("a", error));
        CHECK_FALSE(scheduler->GetTask("a").has_value());
        CHECK(LoadFromDisk(dir).empty());
    }
}

TEST_CASE("Due tasks run and record their run", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;

    Task early = DailyTask("early", 2);
    Task late = DailyTask("late", 20);
    late.created_at = MakeDateTime(2025, 3, 1, 21, 0);
    Task off = DailyTask("off", 1);
    off.enabled = false;
    REQUIRE(scheduler->AddTask(early, error));
    REQUIRE(scheduler->AddTask(late, error));
    REQUIRE(scheduler->AddTask(off, error));

    const DateTime now = MakeDateTime(2025, 3, 2, 8, 0);
    auto due = scheduler->DueTasks(now);
    REQUIRE(due.size() == 1);
    CHECK(due[0].id == "early");

    SECTION("success updates last_run in memory and on disk") {
        CHECK(scheduler->RunDueTasks(now) == 1);
        REQUIRE(engine.Requests().size() == 1);
        CHECK(engine.Requests()[0].target_path == "/data/early");
        CHECK(engine.Requests()[0].resource_limit == 50);

        CHECK(scheduler->GetTask("early")->last_run == now);
        CHECK(LoadFromDisk(dir)[0].last_run == now);
        CHECK(scheduler->DueTasks(now).empty());
        CHECK(scheduler->RunDueTasks(now) == 0);
        CHECK(engine.Requests().size() == 1);
    }

    SECTION("a failed run waits for the next occurrence") {
        engine.mode = FakeEngine::Mode::FAIL;
        CHECK(scheduler->RunDueTasks(now) == 0);
        for (int i = 1; i <= 4; ++i) {
            CHECK(scheduler->RunDueTasks(now + seconds(10 * i)) == 0);
        }
        CHECK(engine.Requests().size() == 1);
        CHECK_FALSE(scheduler->GetTask("early")->last_run.has_value());
        CHECK(scheduler->DueTasks(now + minutes(1)).empty());

        auto tomorrow = scheduler->DueTasks(MakeDateTime(2025, 3, 3, 2, 0));
        REQUIRE(tomorrow.size() == 2);
        CHECK(tomorrow[0].id == "early");
    }

    SECTION("an engine exception is contained") {
        engine.mode = FakeEngine::Mode::THROW;
        CHECK(scheduler->RunDueTasks(now) == 0);
        CHECK_FALSE(scheduler->RunTaskNow("early", error));
        CHECK(error.find("connection refused") != std::string::npos);
    }

    SECTION("run now ignores the schedule") {
        REQUIRE(scheduler->RunTaskNow("late", error));
        CHECK(scheduler->GetTask("late")->last_run.has_value());
        CHECK_FALSE(scheduler->RunTaskNow("ghost", error));
        CHECK(error == "task not found");
    }
}

TEST_CASE("A one-shot task that fails is not retried", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    engine.mode = FakeEngine::Mode::FAIL;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;

    Task once;
    once.id = "once";
    once.name = "one shot";
    once.target_path = "/data/once";
    once.instruction = "sort";
    once.policy = RecurrencePolicy::ONCE;
    once.anchor_time = MakeDateTime(2025, 3, 5, 12, 0);
    once.created_at = MakeDateTime(2025, 3, 1, 9, 0);
    REQUIRE(scheduler->AddTask(once, error));

    const DateTime first = MakeDateTime(2025, 3, 5, 12, 0) + seconds(5);
    for (int i = 0; i < 5; ++i) {
        CHECK(scheduler->RunDueTasks(first + seconds(10 * i)) == 0);
    }
    CHECK(engine.Requests().size() == 1);
    CHECK_FALSE(scheduler->GetTask("once")->last_run.has_value());

    engine.mode = FakeEngine::Mode::SUCCEED;
    CHECK(scheduler->RunDueTasks(MakeDateTime(2025, 3, 6, 12, 0)) == 0);
    CHECK(engine.Requests().size() == 1);
    CHECK(scheduler->UpcomingTasks(5, first).empty());
}

TEST_CASE("Upcoming runs are sorted and limited", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;

    for (auto [id, hour] : {std::pair<const char *, int>{"c", 22}, {"a", 9}, {"b", 15}}) {
        Task task = DailyTask(id, hour);
        REQUIRE(scheduler->AddTask(task, error));
    }
    Task off = DailyTask("off", 10);
    off.enabled = false;
    REQUIRE(scheduler->AddTask(off, error));

    const DateTime now = MakeDateTime(2025, 3, 5, 12, 0);
    auto upcoming = scheduler->UpcomingTasks(10, now);
    REQUIRE(upcoming.size() == 3);
    CHECK(upcoming[0].task.id == "b");
    CHECK(upcoming[0].next_run == MakeDateTime(2025, 3, 5, 15, 0));
    CHECK(upcoming[1].task.id == "c");
    CHECK(upcoming[2].task.id == "a");
    CHECK(upcoming[2].next_run == MakeDateTime(2025, 3, 6, 9, 0));

    CHECK(scheduler->UpcomingTasks(2, now).size() == 2);
    CHECK(scheduler->UpcomingTasks(0, now).empty());
}

TEST_CASE("Common task presets", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;
    Task created;

    SECTION("daily cleanup") {
        REQUIRE(scheduler->CreateCommonTask("daily_cleanup", "/srv/inbox", created, error));
        CHECK(created.name == "Daily Cleanup");
        CHECK(created.target_path == "/srv/inbox");
        CHECK(created.policy == RecurrencePolicy::DAILY);
        CHECK(HourOf(*created.anchor_time) == 2);
        CHECK(created.resource_limit == 40);
        CHECK(created.priority == 2);
    }
    SECTION("weekly organization defaults to ~/Documents on Sundays") {
        REQUIRE(scheduler->CreateCommonTask("weekly_organization", "", created, error));
        CHECK(created.target_path == (HomeDirectory() / "Documents").string());
        CHECK(created.days_of_week == std::vector<int>{6});
        CHECK(HourOf(*created.anchor_time) == 3);
        CHECK(created.resource_limit == 70);
    }
    SECTION("monthly archive on the first") {
        REQUIRE(scheduler->CreateCommonTask("monthly_archive", "", created, error));
        CHECK(created.target_path == HomeDirectory().string());
        CHECK(created.day_of_month == 1);
        CHECK(HourOf(*created.anchor_time) == 4);
    }
    SECTION("smart maintenance is adaptive") {
        REQUIRE(scheduler->CreateCommonTask("smart", "/srv/inbox", created, error));
        CHECK(created.policy == RecurrencePolicy::ADAPTIVE);
        CHECK(created.resource_limit == 30);
        REQUIRE(created.anchor_time.has_value());
        CHECK(HourOf(*created.anchor_time) == 3);
        CHECK(MinuteOf(*created.anchor_time) == 0);
    }
    SECTION("unknown kinds are an error") {
        CHECK_FALSE(scheduler->CreateCommonTask("hourly", "", created, error));
        CHECK(error == "unknown common task 'hourly'");
        CHECK(scheduler->ListTasks().empty());
    }
}

TEST_CASE("Adaptive tasks freeze the analyzer's pick", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;

    auto store = std::make_unique<UsageStore>(dir / "data" / "scheduler.db");
    std::string error;
    const int today = WeekdayIndex(DateOf(LocalNow()));
    UsageSample quiet;
    quiet.day_of_week = today;
    quiet.hour = 23;
    quiet.minute = 15;
    UsageSample busy = quiet;
    busy.hour = 3;
    busy.minute = 0;
    busy.cpu_percent = 90;
    REQUIRE(store->InsertSample(quiet, error));
    REQUIRE(store->InsertSample(busy, error));

    auto analyzer =
        std::make_unique<UsagePatternAnalyzer>(std::move(store), std::make_unique<IdleProbe>());
    auto scheduler = MakeScheduler(dir, engine, std::move(analyzer));

    Task created;
    REQUIRE(scheduler->CreateAdaptiveTask("night", "/srv", "tidy", created, error));
    REQUIRE(created.anchor_time.has_value());
    CHECK(HourOf(*created.anchor_time) == 23);
    CHECK(MinuteOf(*created.anchor_time) == 15);

    SECTION("new samples do not move an existing task") {
        UsageSample quieter = quiet;
        quieter.hour = 1;
        REQUIRE(scheduler->Analyzer()->Store().InsertSample(quieter, error));
        quieter.minute = 16;
        REQUIRE(scheduler->Analyzer()->Store().InsertSample(quieter, error));

        auto stored = scheduler->GetTask(created.id);
        CHECK(HourOf(*stored->anchor_time) == 23);

        Task refreshed = *stored;
        refreshed.name = "renamed";
        REQUIRE(scheduler->UpdateTask(refreshed, error));
        CHECK(HourOf(*scheduler->GetTask(created.id)->anchor_time) == 23);
    }
}

TEST_CASE("External edits to the task file are picked up", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    auto scheduler = MakeScheduler(dir, engine);
    std::string error;

    Task task = DailyTask("a", 2);
    REQUIRE(scheduler->AddTask(task, error));
    CHECK_FALSE(scheduler->ReloadIfChanged());

    const auto path = dir / "data" / "scheduled_tasks.json";
    TaskStore other(path);
    REQUIRE(other.Save({DailyTask("a", 2), DailyTask("b", 3)}, error));
    std::filesystem::last_write_time(path,
                                     std::filesystem::last_write_time(path) + seconds(5));

    CHECK(scheduler->RunDueTasks(MakeDateTime(2025, 3, 1, 13, 0)) == 0);
    CHECK(scheduler->ListTasks().size() == 2);
    CHECK(scheduler->GetTask("b").has_value());
    CHECK_FALSE(scheduler->ReloadIfChanged());
}

TEST_CASE("The polling loop runs due work until stopped", "[scheduler]") {
    TempDir dir;
    FakeEngine engine;
    SchedulerOptions options;
    options.poll_interval = milliseconds(20);
    options.stop_timeout = milliseconds(500);
    auto scheduler = MakeScheduler(dir, engine, nullptr, options);
    std::string error;

    Task task = DailyTask("midnight", 0);
    task.created_at = LocalNow() - days{2};
    REQUIRE(scheduler->AddTask(task, error));

    scheduler->Start();
    scheduler->Start();
    CHECK(scheduler->IsRunning());
    for (int i = 0; i < 200 && engine.Requests().empty(); ++i) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    scheduler->Stop();
    CHECK_FALSE(scheduler->IsRunning());

    CHECK(engine.Requests().size() == 1);
    CHECK(scheduler->GetTask("midnight")->last_run.has_value());

    scheduler->Stop();
    scheduler->Start();
    CHECK(scheduler->IsRunning());
    scheduler->Stop();
}

TEST_CASE("Stop does not wait past its timeout for a running task", "[scheduler]") {
    TempDir dir;
    GateEngine engine;
    SchedulerOptions options;
    options.poll_interval = milliseconds(20);
    options.stop_timeout = milliseconds(100);
    Scheduler scheduler(std::make_unique<TaskStore>(dir / "data" / "scheduled_tasks.json"),
                        nullptr, engine, options);
    OpenOnExit release{engine};
    std::string error;

    Task task = DailyTask("slow", 0);
    task.created_at = LocalNow() - days{2};
    REQUIRE(scheduler.AddTask(task, error));

    scheduler.Start();
    REQUIRE(engine.WaitEntered(seconds(2)));

    const auto started = steady_clock::now();
    scheduler.Stop();
    CHECK(steady_clock::now() - started < seconds(2));
    CHECK_FALSE(scheduler.IsRunning());
    CHECK_FALSE(scheduler.GetTask("slow")->last_run.has_value());

    engine.Open();
    scheduler.Start();
    for (int i = 0; i < 200 && !scheduler.GetTask("slow")->last_run; ++i) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    CHECK(scheduler.GetTask("slow")->last_run.has_value());
    scheduler.Stop();
}
