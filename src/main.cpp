#include "config.hpp"
#include "logging.hpp"
#include "organizer.hpp"
#include "process.hpp"
#include "recurrence.hpp"
#include "scheduler.hpp"
#include "status_server.hpp"
#include "system_load.hpp"
#include "task_store.hpp"
#include "usage_analyzer.hpp"
#include "usage_store.hpp"
#include "watchdog.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct CliArgs {
    std::string config_path;
    std::optional<LogLevel> log_level;
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

void PrintUsage() {
    std::cout
        << "Usage: sortd [--config FILE] [--log-level debug|info|off] <command> [args]\n"
           "\n"
           "Commands:\n"
           "  serve                      run the scheduler and the status server\n"
           "  watchdog                   supervise the organizer services\n"
           "  list                       list scheduled tasks\n"
           "  add --name N --path P --instruction I --type once|daily|weekly|monthly|adaptive\n"
           "      [--time HH:MM | YYYY-MM-DDTHH:MM] [--days 0,2,4] [--day N]\n"
           "      [--priority N] [--limit PCT]\n"
           "  remove <task_id>           remove a task\n"
           "  run <task_id>              run a task now\n"
           "  common <daily_cleanup|weekly_organization|monthly_archive|smart> [--path P]\n"
           "  upcoming [--limit N]       next scheduled runs\n"
           "  report                     average system load by weekday and hour\n"
           "  health                     run one health check and print it\n";
}

bool ParseArgs(int argc, char **argv, CliArgs &args, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            args.command = "help";
            return true;
        }
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                args.config_path = value;
            } else if (arg == "--log-level") {
                args.log_level = ParseLogLevel(value, LOG_INFO);
            } else {
                args.options[arg.substr(2)] = value;
            }
            continue;
        }
        if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    if (args.command.empty()) {
        error = "no command given";
        return false;
    }
    return true;
}

std::string Option(const CliArgs &args, const std::string &key,
                   const std::string &fallback = "") {
    auto it = args.options.find(key);
    return it == args.options.end() ? fallback : it->second;
}

bool ParseInt(const std::string &text, int &value) {
    try {
        std::size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception &) {
        return false;
    }
}

bool ParseDays(const std::string &text, std::vector<int> &days) {
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        int day = 0;
        if (!ParseInt(part, day)) {
            return false;
        }
        days.push_back(day);
    }
    return !days.empty();
}

std::atomic<bool> g_Running{true};

void SignalHandler(int) {
    g_Running = false;
}

void InstallSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
}

void WaitForShutdown() {
    while (g_Running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

std::unique_ptr<UsagePatternAnalyzer> MakeAnalyzer(const Config &config) {
    auto store = std::make_unique<UsageStore>(config.UsageDatabase());
    auto probe = std::make_unique<ProcLoadProbe>();
    return std::make_unique<UsagePatternAnalyzer>(std::move(store), std::move(probe),
                                                  config.usage);
}

std::unique_ptr<Scheduler> MakeScheduler(const Config &config, OrganizeEngine &engine) {
    return std::make_unique<Scheduler>(std::make_unique<TaskStore>(config.TaskFile()),
                                       MakeAnalyzer(config), engine, config.scheduler);
}

std::unique_ptr<Watchdog> MakeWatchdog(const Config &config) {
    return std::make_unique<Watchdog>(MakeWatchdogOptions(config),
                                      std::make_unique<ProcessService>(config.api_server),
                                      std::make_unique<ProcessService>(config.file_watcher));
}

void PrintTask(const Task &task, DateTime now) {
    auto next = NextRunTime(task, now);
    std::printf("%s  %-28s %-8s next: %-19s last: %-19s %s\n", task.id.c_str(),
                task.name.c_str(), PolicyName(task.policy).c_str(),
                next ? FormatDateTime(*next).c_str() : "-",
                task.last_run ? FormatDateTime(*task.last_run).c_str() : "-",
                task.enabled ? "" : "(disabled)");
    std::printf("    %s: %s\n", task.target_path.c_str(), task.instruction.c_str());
}

bool BuildTask(const CliArgs &args, Task &task, std::string &error) {
    task.name = Option(args, "name", task.name);
    task.target_path = ExpandUser(Option(args, "path"));
    task.instruction = Option(args, "instruction");
    if (task.target_path.empty() || task.instruction.empty()) {
        error = "--path and --instruction are required";
        return false;
    }

    std::string type = Option(args, "type", "once");
    auto policy = ParsePolicy(type);
    if (!policy) {
        error = "unknown --type '" + type + "'";
        return false;
    }
    task.policy = *policy;

    std::string time = Option(args, "time");
    if (!time.empty()) {
        if (auto full = ParseDateTime(time)) {
            task.anchor_time = full;
        } else if (auto tod = ParseTimeOfDay(time)) {
            const DateTime now = LocalNow();
            DateTime anchor = CombineDateTime(DateOf(now), *tod);
            if (task.policy == RecurrencePolicy::ONCE && anchor <= now) {
                anchor += std::chrono::days{1};
            }
            task.anchor_time = anchor;
        } else {
            error = "--time must be HH:MM or YYYY-MM-DDTHH:MM";
            return false;
        }
    }

    std::string days = Option(args, "days");
    if (!days.empty() && !ParseDays(days, task.days_of_week)) {
        error = "--days must be a comma separated list of 0 (Monday) to 6 (Sunday)";
        return false;
    }

    std::string day = Option(args, "day");
    if (!day.empty()) {
        int value = 0;
        if (!ParseInt(day, value)) {
            error = "--day must be a number";
            return false;
        }
        task.day_of_month = value;
    }

    for (const auto &[key, field] :
         {std::pair<const char *, int *>{"priority", &task.priority},
          std::pair<const char *, int *>{"limit", &task.resource_limit}}) {
        std::string text = Option(args, key);
        if (!text.empty() && !ParseInt(text, *field)) {
            error = std::string("--") + key + " must be a number";
            return false;
        }
    }
    return true;
}

int RunServe(const Config &config, OrganizeEngine &engine) {
    InstallSignalHandlers();

    auto scheduler = MakeScheduler(config, engine);
    StatusServer server(*scheduler, config.WatchdogStatusFile());
    std::string error;
    if (!server.Start(config.status_host, config.status_port, error)) {
        spdlog::error("Main: Status server not started: {}", error);
    }
    scheduler->Start();

    WaitForShutdown();
    spdlog::info("Main: Shutting down");
    server.Stop();
    scheduler->Stop();
    return 0;
}

int RunWatchdog(const Config &config) {
    InstallSignalHandlers();

    auto watchdog = MakeWatchdog(config);
    watchdog->Start();

    WaitForShutdown();
    spdlog::info("Main: Stopping watchdog");
    watchdog->Stop();
    return 0;
}

int RunCommand(const CliArgs &args, const Config &config) {
    HttpOrganizeEngine engine(config.organizer);

    if (args.command == "serve") {
        return RunServe(config, engine);
    }
    if (args.command == "watchdog") {
        return RunWatchdog(config);
    }
    if (args.command == "health") {
        auto watchdog = MakeWatchdog(config);
        HealthStatus status = watchdog->CheckHealth();
        std::cout << status.ToJson().dump(2) << "\n";
        return status.system_healthy ? 0 : 1;
    }

    auto scheduler = MakeScheduler(config, engine);
    const DateTime now = LocalNow();
    std::string error;

    if (args.command == "list") {
        auto tasks = scheduler->ListTasks();
        if (tasks.empty()) {
            std::cout << "No scheduled tasks\n";
        }
        for (const auto &task : tasks) {
            PrintTask(task, now);
        }
        return 0;
    }

    if (args.command == "add") {
        Task task;
        if (!BuildTask(args, task, error) || !scheduler->AddTask(task, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        std::cout << "Added task " << task.id << "\n";
        PrintTask(task, now);
        return 0;
    }

    if (args.command == "remove" || args.command == "run") {
        if (args.positional.empty()) {
            std::cerr << "Error: " << args.command << " needs a task id\n";
            return 1;
        }
        const std::string &id = args.positional.front();
        bool ok = args.command == "remove" ? scheduler->RemoveTask(id, error)
                                           : scheduler->RunTaskNow(id, error);
        if (!ok) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        std::cout << (args.command == "remove" ? "Removed task " : "Ran task ") << id << "\n";
        return 0;
    }

    if (args.command == "common") {
        if (args.positional.empty()) {
            std::cerr << "Error: common needs a task kind\n";
            return 1;
        }
        Task created;
        if (!scheduler->CreateCommonTask(args.positional.front(),
                                         ExpandUser(Option(args, "path")), created, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        std::cout << "Added task " << created.id << "\n";
        PrintTask(created, now);
        return 0;
    }

    if (args.command == "upcoming") {
        int limit = 5;
        std::string text = Option(args, "limit");
        if (!text.empty() && !ParseInt(text, limit)) {
            std::cerr << "Error: --limit must be a number\n";
            return 1;
        }
        auto runs = scheduler->UpcomingTasks(limit > 0 ? static_cast<std::size_t>(limit) : 0, now);
        for (const auto &run : runs) {
            std::printf("%s  %-28s %s\n", FormatDateTime(run.next_run).c_str(),
                        run.task.name.c_str(), run.task.id.c_str());
        }
        return 0;
    }

    if (args.command == "report") {
        std::cout << UsageReportToJson(scheduler->Analyzer()->Report()).dump(2) << "\n";
        return 0;
    }

    std::cerr << "Error: unknown command '" << args.command << "'\n";
    PrintUsage();
    return 1;
}

} // namespace

int main(int argc, char **argv) {
    CliArgs args;
    std::string error;
    if (!ParseArgs(argc, argv, args, error)) {
        std::cerr << "Error: " << error << "\n";
        PrintUsage();
        return 1;
    }
    if (args.command == "help") {
        PrintUsage();
        return 0;
    }

    Config config;
    try {
        config = LoadConfig(args.config_path);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (args.log_level) {
        config.log_level = *args.log_level;
    }

    if (!EnsureDirectories(config, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    SetupLogging(config.logs_dir, config.log_level);

    try {
        return RunCommand(args, config);
    } catch (const std::exception &e) {
        spdlog::error("Main: {}", e.what());
        return 1;
    }
}
