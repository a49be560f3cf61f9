#include <catch2/catch.hpp>

#include "config.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <fstream>

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
  public:
    EnvGuard(const char *name, const std::string &value) : m_Name(name) {
        const char *old = std::getenv(name);
        if (old) {
            m_Old = old;
            m_HadOld = true;
        }
        setenv(name, value.c_str(), 1);
    }
    ~EnvGuard() {
        if (m_HadOld) {
            setenv(m_Name, m_Old.c_str(), 1);
        } else {
            unsetenv(m_Name);
        }
    }

  private:
    const char *m_Name;
    std::string m_Old;
    bool m_HadOld = false;
};

void WriteFile(const std::filesystem::path &path, const std::string &text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

TEST_CASE("Defaults live under the user's home", "[config]") {
    TempDir dir;
    EnvGuard home("HOME", dir.Path().string());
    EnvGuard xdgData("XDG_DATA_HOME", "");
    EnvGuard xdgConfig("XDG_CONFIG_HOME", "");

    CHECK(DefaultConfigPath() == dir / ".config" / "sortd" / "config.json");

    Config config = LoadConfig("");
    CHECK(config.base_dir == dir / ".local" / "share" / "sortd");
    CHECK(config.TaskFile() == config.base_dir / "data" / "scheduled_tasks.json");
    CHECK(config.UsageDatabase() == config.base_dir / "data" / "scheduler.db");
    CHECK(config.LogFile() == config.base_dir / "logs" / "sortd.log");
    CHECK(config.safe_path == dir / "OrganizeFolder");
    CHECK(config.log_level == LOG_INFO);

    CHECK(config.organizer.url == "http://127.0.0.1:8000");
    CHECK(config.organizer.endpoint == "/chat");
    CHECK(config.organizer.read_timeout == std::chrono::seconds(600));
    CHECK(config.scheduler.poll_interval == std::chrono::seconds(10));
    CHECK(config.usage.sample_interval == std::chrono::minutes(5));
    CHECK(config.watchdog_interval == std::chrono::seconds(30));
    CHECK(config.max_failures == 5);
    CHECK(config.status_port == 8079);

    CHECK(config.api_server.port == 8000);
    CHECK(config.api_server.match_pattern == "uvicorn server:app");
    CHECK(config.file_watcher.match_pattern == "watch_files.py");
    CHECK(config.file_watcher.command.back() == (dir / "OrganizeFolder").string());
    CHECK(config.file_watcher.log_file == (config.logs_dir / "file_watcher.log").string());

    SECTION("watchdog options follow the paths") {
        WatchdogOptions options = MakeWatchdogOptions(config);
        CHECK(options.required_dirs == RequiredDirectories(config));
        CHECK(options.working_directory == config.safe_path);
        CHECK(options.task_store_path == config.TaskFile());
        CHECK(options.status_file == config.WatchdogStatusFile());
    }

    SECTION("the directories can be created") {
        std::string error;
        REQUIRE(EnsureDirectories(config, error));
        for (const auto &d : RequiredDirectories(config)) {
            CHECK(std::filesystem::is_directory(d));
        }
    }
}

TEST_CASE("A config file overrides only what it names", "[config]") {
    TempDir dir;
    EnvGuard home("HOME", dir.Path().string());
    const auto file = dir / "config.json";
    WriteFile(file, R"({
        "paths": {"base_dir": "~/sortd-home", "safe_path": "/srv/inbox"},
        "log": {"level": "debug"},
        "organizer": {"url": "http://organizer:9000"},
        "scheduler": {"poll_interval_s": 0},
        "watchdog": {"max_failures": 3,
                     "services": {"api_server": {"command": []}}}
    })");

    Config config = LoadConfig(file);
    CHECK(config.base_dir == dir / "sortd-home");
    CHECK(config.data_dir == dir / "sortd-home" / "data");
    CHECK(config.safe_path == "/srv/inbox");
    CHECK(config.log_level == LOG_DEBUG);
    CHECK(config.organizer.url == "http://organizer:9000");
    CHECK(config.organizer.endpoint == "/chat");
    CHECK(config.scheduler.poll_interval == std::chrono::seconds(1));
    CHECK(config.max_failures == 3);
    CHECK(config.api_server.command.empty());
    CHECK(config.file_watcher.command.back() == "/srv/inbox");
}

TEST_CASE("Environment variables win over the file", "[config]") {
    TempDir dir;
    EnvGuard home("HOME", dir.Path().string());
    const auto file = dir / "config.json";
    WriteFile(file, R"({"paths": {"data_dir": "/from/file"}, "log": {"level": "debug"}})");

    EnvGuard data("SORTD_DATA_DIR", (dir / "env-data").string());
    EnvGuard url("SORTD_ORGANIZER_URL", "http://10.0.0.5:8000");
    EnvGuard level("SORTD_LOG_LEVEL", "off");

    Config config = LoadConfig(file);
    CHECK(config.data_dir == dir / "env-data");
    CHECK(config.organizer.url == "http://10.0.0.5:8000");
    CHECK(config.log_level == LOG_OFF);
}

TEST_CASE("Broken config files are fatal", "[config]") {
    TempDir dir;
    const auto file = dir / "config.json";

    SECTION("invalid JSON") {
        WriteFile(file, "{ \"paths\": ");
        CHECK_THROWS_AS(LoadConfig(file), std::runtime_error);
    }
    SECTION("not an object") {
        WriteFile(file, "[1, 2]");
        CHECK_THROWS_AS(LoadConfig(file), std::runtime_error);
    }
    SECTION("an explicit path that does not exist") {
        CHECK_THROWS_WITH(LoadConfig(dir / "missing.json"),
                          Catch::Contains("does not exist"));
    }
}

TEST_CASE("Home expansion", "[config]") {
    EnvGuard home("HOME", "/home/tester");
    CHECK(ExpandUser("~") == "/home/tester");
    CHECK(ExpandUser("~/Downloads") == "/home/tester/Downloads");
    CHECK(ExpandUser("/abs/~/x") == "/abs/~/x");
    CHECK(ParseLogLevel("verbose", LOG_INFO) == LOG_INFO);
}
