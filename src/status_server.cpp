#include "status_server.hpp"

#include "json.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace {

void SetJson(httplib::Response &res, const nlohmann::json &payload, int status = 200) {
    res.status = status;
    res.set_content(payload.dump(), "application/json");
}

void SetError(httplib::Response &res, const std::string &message, int status) {
    res.status = status;
    res.set_content(message, "text/plain");
}

nlohmann::json ParseJsonOrThrow(const std::string &body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw std::runtime_error("invalid json body");
    }
    return data;
}

} // namespace

// ─────────────────────────────────────
nlohmann::json UpcomingToJson(const std::vector<UpcomingRun> &runs) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &run : runs) {
        nlohmann::json entry = TaskToJson(run.task);
        entry["next_run"] = FormatDateTime(run.next_run);
        out.push_back(std::move(entry));
    }
    return out;
}

// ─────────────────────────────────────
nlohmann::json UsageReportToJson(const UsageReport &report) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto &[weekday, hours] : report) {
        nlohmann::json byHour = nlohmann::json::object();
        for (const auto &[hour, load] : hours) {
            byHour[std::to_string(hour)] = load;
        }
        out[WeekdayName(weekday)] = std::move(byHour);
    }
    return out;
}

// ─────────────────────────────────────
StatusServer::StatusServer(Scheduler &scheduler, std::filesystem::path watchdog_status_file)
    : m_Scheduler(scheduler), m_WatchdogStatusFile(std::move(watchdog_status_file)),
      m_Server(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

// ─────────────────────────────────────
StatusServer::~StatusServer() {
    Stop();
}

// ─────────────────────────────────────
bool StatusServer::Start(const std::string &host, int port, std::string &error) {
    if (m_Thread.joinable()) {
        return true;
    }
    if (!m_Server->bind_to_port(host, port)) {
        error = "unable to bind " + host + ":" + std::to_string(port);
        return false;
    }
    m_Thread = std::thread([this]() { m_Server->listen_after_bind(); });
    spdlog::info("StatusServer: Listening on http://{}:{}", host, port);
    return true;
}

// ─────────────────────────────────────
void StatusServer::Stop() {
    if (!m_Thread.joinable()) {
        return;
    }
    m_Server->stop();
    m_Thread.join();
    spdlog::info("StatusServer: Stopped");
}

// ─────────────────────────────────────
void StatusServer::RegisterRoutes() {
    auto &server = *m_Server;

    server.Get("/health", [this](const httplib::Request &, httplib::Response &res) {
        nlohmann::json body = {
            {"status", "ok"},
            {"scheduler_running", m_Scheduler.IsRunning()},
            {"tasks", m_Scheduler.ListTasks().size()},
            {"time", FormatDateTime(LocalNow())},
        };
        SetJson(res, body);
    });

    server.Get("/tasks", [this](const httplib::Request &, httplib::Response &res) {
        spdlog::debug("StatusServer: [GET] /tasks");
        nlohmann::json rows = nlohmann::json::array();
        for (const auto &task : m_Scheduler.ListTasks()) {
            rows.push_back(TaskToJson(task));
        }
        SetJson(res, rows);
    });

    server.Get("/tasks/upcoming", [this](const httplib::Request &req, httplib::Response &res) {
        std::size_t limit = 5;
        if (req.has_param("limit")) {
            try {
                int requested = std::stoi(req.get_param_value("limit"));
                limit = requested > 0 ? static_cast<std::size_t>(requested) : 0;
            } catch (const std::exception &) {
                SetError(res, "limit must be a number", 400);
                return;
            }
        }
        SetJson(res, UpcomingToJson(m_Scheduler.UpcomingTasks(limit, LocalNow())));
    });

    server.Post("/tasks", [this](const httplib::Request &req, httplib::Response &res) {
        spdlog::debug("StatusServer: [POST] /tasks");
        try {
            nlohmann::json data = ParseJsonOrThrow(req.body);
            JsonParse parse;
            Task task = TaskFromJson(data);
            if (parse.GetString(data, "task_id", "").empty()) {
                task.id.clear();
            }
            std::string error;
            if (!m_Scheduler.AddTask(task, error)) {
                SetError(res, error, 400);
                return;
            }
            SetJson(res, TaskToJson(task), 201);
        } catch (const std::exception &e) {
            SetError(res, e.what(), 400);
        }
    });

    server.Post("/tasks/update", [this](const httplib::Request &req, httplib::Response &res) {
        spdlog::debug("StatusServer: [POST] /tasks/update");
        try {
            nlohmann::json data = ParseJsonOrThrow(req.body);
            JsonParse parse;
            std::string id = parse.GetString(data, "task_id", "");
            auto existing = m_Scheduler.GetTask(id);
            if (!existing) {
                SetError(res, "task not found", 404);
                return;
            }
            nlohmann::json merged = TaskToJson(*existing);
            parse.DeepMerge(merged, data);
            Task task = TaskFromJson(merged);

            std::string error;
            if (!m_Scheduler.UpdateTask(task, error)) {
                SetError(res, error, error == "task not found" ? 404 : 400);
                return;
            }
            auto updated = m_Scheduler.GetTask(id);
            SetJson(res, TaskToJson(updated ? *updated : task));
        } catch (const std::exception &e) {
            SetError(res, e.what(), 400);
        }
    });

    server.Delete(R"(/tasks/([A-Za-z0-9_-]+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                      std::string id = req.matches[1];
                      std::string error;
                      if (!m_Scheduler.RemoveTask(id, error)) {
                          SetError(res, error, error == "task not found" ? 404 : 500);
                          return;
                      }
                      res.status = 200;
                      res.set_content("ok", "text/plain");
                  });

    server.Post(R"(/tasks/([A-Za-z0-9_-]+)/run)",
                [this](const httplib::Request &req, httplib::Response &res) {
                    std::string id = req.matches[1];
                    std::string error;
                    if (!m_Scheduler.RunTaskNow(id, error)) {
                        SetError(res, error, error == "task not found" ? 404 : 502);
                        return;
                    }
                    res.status = 200;
                    res.set_content("ok", "text/plain");
                });

    server.Get("/usage/report", [this](const httplib::Request &, httplib::Response &res) {
        auto *analyzer = m_Scheduler.Analyzer();
        if (!analyzer) {
            SetError(res, "usage analyzer not available", 503);
            return;
        }
        SetJson(res, UsageReportToJson(analyzer->Report()));
    });

    server.Get("/watchdog/status", [this](const httplib::Request &, httplib::Response &res) {
        std::ifstream file(m_WatchdogStatusFile);
        if (!file.is_open()) {
            SetError(res, "no watchdog status yet", 404);
            return;
        }
        nlohmann::json status = nlohmann::json::parse(file, nullptr, false);
        if (status.is_discarded()) {
            SetError(res, "watchdog status file is unreadable", 500);
            return;
        }
        SetJson(res, status);
    });

    server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.status == 404 && res.body.empty()) {
            res.set_content("not found", "text/plain");
        }
    });
}
