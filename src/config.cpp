#include "config.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

std::string Env(const char *name) {
    const char *value = std::getenv(name);
    return value && *value ? std::string(value) : std::string();
}

std::filesystem::path DefaultBaseDir() {
    std::string xdgDataHome = Env("XDG_DATA_HOME");
    if (!xdgDataHome.empty()) {
        return std::filesystem::path(xdgDataHome) / "sortd";
    }
    return HomeDirectory() / ".local" / "share" / "sortd";
}

ServiceSpec ServiceFromJson(const std::string &name, const nlohmann::json &j,
                            const Config &config) {
    JsonParse parse;
    ServiceSpec spec;
    spec.name = name;
    if (j.contains("command") && j["command"].is_array()) {
        for (auto arg : parse.JsonArray2String(j["command"])) {
            const std::string placeholder = "{safe_path}";
            auto pos = arg.find(placeholder);
            if (pos != std::string::npos) {
                arg.replace(pos, placeholder.size(), config.safe_path.string());
            }
            spec.command.push_back(arg);
        }
    }
    spec.working_dir = ExpandUser(parse.GetString(j, "working_dir", ""));
    spec.log_file = (config.logs_dir / (name + ".log")).string();
    spec.host = parse.GetString(j, "host", "127.0.0.1");
    spec.port = parse.GetInt(j, "port", 0);
    spec.health_path = parse.GetString(j, "health_path", "");
    spec.match_pattern = parse.GetString(j, "match_pattern", "");
    spec.startup_grace = std::chrono::milliseconds(parse.GetInt(j, "startup_grace_ms", 3000));
    return spec;
}

} // namespace

// ─────────────────────────────────────
std::filesystem::path HomeDirectory() {
    std::string home = Env("HOME");
    if (!home.empty()) {
        return home;
    }
    struct passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    spdlog::warn("Config: HOME is not set, using the current directory");
    return std::filesystem::current_path();
}

// ─────────────────────────────────────
std::string ExpandUser(const std::string &path) {
    if (path == "~") {
        return HomeDirectory().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (HomeDirectory() / path.substr(2)).string();
    }
    return path;
}

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    std::string xdgConfigHome = Env("XDG_CONFIG_HOME");
    std::filesystem::path base =
        xdgConfigHome.empty() ? HomeDirectory() / ".config" : std::filesystem::path(xdgConfigHome);
    return base / "sortd" / "config.json";
}

// ─────────────────────────────────────
nlohmann::json DefaultConfigJson() {
    return {
        {"paths",
         {{"base_dir", ""},
          {"data_dir", ""},
          {"logs_dir", ""},
          {"safe_path", "~/OrganizeFolder"}}},
        {"log", {{"level", "info"}}},
        {"organizer",
         {{"url", "http://127.0.0.1:8000"},
          {"endpoint", "/chat"},
          {"connect_timeout_s", 5},
          {"read_timeout_s", 600}}},
        {"scheduler", {{"poll_interval_s", 10}, {"stop_timeout_s", 5}}},
        {"usage", {{"sample_interval_s", 300}, {"retry_backoff_s", 60}, {"retention_days", 0}}},
        {"watchdog",
         {{"check_interval_s", 30},
          {"max_failures", 5},
          {"services",
           {{"api_server",
             {{"command",
               {"python3", "-m", "uvicorn", "server:app", "--host", "127.0.0.1", "--port",
                "8000"}},
              {"working_dir", ""},
              {"port", 8000},
              {"health_path", ""},
              {"match_pattern", "uvicorn server:app"}}},
            {"file_watcher",
             {{"command", {"python3", "watch_files.py", "--path", "{safe_path}"}},
              {"working_dir", ""},
              {"port", 0},
              {"match_pattern", "watch_files.py"}}}}}}},
        {"status_server", {{"host", "127.0.0.1"}, {"port", 8079}}},
    };
}

// ─────────────────────────────────────
Config LoadConfig(const std::filesystem::path &file) {
    JsonParse parse;
    nlohmann::json merged = DefaultConfigJson();

    const std::filesystem::path path = file.empty() ? DefaultConfigPath() : file;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw std::runtime_error("unable to open config file " + path.string());
        }
        nlohmann::json user = nlohmann::json::parse(in, nullptr, false);
        if (user.is_discarded() || !user.is_object()) {
            throw std::runtime_error("config file " + path.string() + " is not a JSON object");
        }
        parse.DeepMerge(merged, user);
        spdlog::debug("Config: Loaded {}", path.string());
    } else if (!file.empty()) {
        throw std::runtime_error("config file " + path.string() + " does not exist");
    }

    nlohmann::json env = nlohmann::json::object();
    if (auto v = Env("SORTD_DATA_DIR"); !v.empty()) {
        env["paths"]["data_dir"] = v;
    }
    if (auto v = Env("SORTD_LOGS_DIR"); !v.empty()) {
        env["paths"]["logs_dir"] = v;
    }
    if (auto v = Env("SORTD_SAFE_PATH"); !v.empty()) {
        env["paths"]["safe_path"] = v;
    }
    if (auto v = Env("SORTD_ORGANIZER_URL"); !v.empty()) {
        env["organizer"]["url"] = v;
    }
    if (auto v = Env("SORTD_LOG_LEVEL"); !v.empty()) {
        env["log"]["level"] = v;
    }
    parse.DeepMerge(merged, env);

    return ConfigFromJson(merged);
}

// ─────────────────────────────────────
Config ConfigFromJson(const nlohmann::json &j) {
    JsonParse parse;
    Config config;

    const nlohmann::json empty = nlohmann::json::object();
    auto section = [&](const char *key) -> const nlohmann::json & {
        return j.contains(key) && j[key].is_object() ? j[key] : empty;
    };

    const auto &paths = section("paths");
    std::string base = ExpandUser(parse.GetString(paths, "base_dir", ""));
    config.base_dir = base.empty() ? DefaultBaseDir() : std::filesystem::path(base);
    std::string data = ExpandUser(parse.GetString(paths, "data_dir", ""));
    config.data_dir = data.empty() ? config.base_dir / "data" : std::filesystem::path(data);
    std::string logs = ExpandUser(parse.GetString(paths, "logs_dir", ""));
    config.logs_dir = logs.empty() ? config.base_dir / "logs" : std::filesystem::path(logs);
    config.safe_path = ExpandUser(parse.GetString(paths, "safe_path", "~/OrganizeFolder"));

    config.log_level = ParseLogLevel(parse.GetString(section("log"), "level", "info"), LOG_INFO);

    const auto &organizer = section("organizer");
    config.organizer.url = parse.GetString(organizer, "url", config.organizer.url);
    config.organizer.endpoint = parse.GetString(organizer, "endpoint", config.organizer.endpoint);
    config.organizer.connect_timeout =
        std::chrono::seconds(parse.GetInt(organizer, "connect_timeout_s", 5));
    config.organizer.read_timeout =
        std::chrono::seconds(parse.GetInt(organizer, "read_timeout_s", 600));

    const auto &scheduler = section("scheduler");
    config.scheduler.poll_interval =
        std::chrono::seconds(std::max(1, parse.GetInt(scheduler, "poll_interval_s", 10)));
    config.scheduler.stop_timeout =
        std::chrono::seconds(std::max(0, parse.GetInt(scheduler, "stop_timeout_s", 5)));

    const auto &usage = section("usage");
    config.usage.sample_interval =
        std::chrono::seconds(std::max(1, parse.GetInt(usage, "sample_interval_s", 300)));
    config.usage.retry_backoff =
        std::chrono::seconds(std::max(1, parse.GetInt(usage, "retry_backoff_s", 60)));
    config.usage.retention_days = std::max(0, parse.GetInt(usage, "retention_days", 0));

    const auto &watchdog = section("watchdog");
    config.watchdog_interval =
        std::chrono::seconds(std::max(1, parse.GetInt(watchdog, "check_interval_s", 30)));
    config.max_failures = std::max(1, parse.GetInt(watchdog, "max_failures", 5));
    const nlohmann::json services =
        watchdog.contains("services") && watchdog["services"].is_object() ? watchdog["services"]
                                                                           : empty;
    config.api_server = ServiceFromJson(
        "api_server", services.contains("api_server") ? services["api_server"] : empty, config);
    config.file_watcher =
        ServiceFromJson("file_watcher",
                        services.contains("file_watcher") ? services["file_watcher"] : empty,
                        config);

    const auto &status = section("status_server");
    config.status_host = parse.GetString(status, "host", config.status_host);
    config.status_port = parse.GetInt(status, "port", config.status_port);
    return config;
}

// ─────────────────────────────────────
std::vector<std::filesystem::path> RequiredDirectories(const Config &config) {
    return {config.safe_path, config.data_dir, config.logs_dir};
}

// ─────────────────────────────────────
bool EnsureDirectories(const Config &config, std::string &error) {
    for (const auto &dir : RequiredDirectories(config)) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            error = "unable to create " + dir.string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
WatchdogOptions MakeWatchdogOptions(const Config &config) {
    WatchdogOptions options;
    options.check_interval = config.watchdog_interval;
    options.max_failures = config.max_failures;
    options.required_dirs = RequiredDirectories(config);
    options.working_directory = config.safe_path;
    options.task_store_path = config.TaskFile();
    options.usage_db_path = config.UsageDatabase();
    options.status_file = config.WatchdogStatusFile();
    return options;
}
