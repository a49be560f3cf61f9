#include "task.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <random>

// ─────────────────────────────────────
std::string PolicyName(RecurrencePolicy policy) {
    switch (policy) {
    case RecurrencePolicy::ONCE:
        return "once";
    case RecurrencePolicy::DAILY:
        return "daily";
    case RecurrencePolicy::WEEKLY:
        return "weekly";
    case RecurrencePolicy::MONTHLY:
        return "monthly";
    case RecurrencePolicy::ADAPTIVE:
        return "adaptive";
    }
    return "once";
}

// ─────────────────────────────────────
std::optional<RecurrencePolicy> ParsePolicy(const std::string &name) {
    if (name == "once") return RecurrencePolicy::ONCE;
    if (name == "daily") return RecurrencePolicy::DAILY;
    if (name == "weekly") return RecurrencePolicy::WEEKLY;
    if (name == "monthly") return RecurrencePolicy::MONTHLY;
    if (name == "adaptive") return RecurrencePolicy::ADAPTIVE;
    return std::nullopt;
}

// ─────────────────────────────────────
std::string GenerateTaskId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned> byte(0, 255);

    unsigned char b[16];
    for (auto &v : b) {
        v = static_cast<unsigned char>(byte(rng));
    }
    // RFC 4122 version 4, variant 1
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", b[0],
                  b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11], b[12], b[13],
                  b[14], b[15]);
    return out;
}

// ─────────────────────────────────────
bool ValidateTask(const Task &task, std::string &error) {
    if (task.resource_limit < 0 || task.resource_limit > 100) {
        error = "resource_limit must be between 0 and 100";
        return false;
    }

    switch (task.policy) {
    case RecurrencePolicy::ONCE:
    case RecurrencePolicy::DAILY:
        if (!task.anchor_time) {
            error = "missing scheduled_time";
            return false;
        }
        break;
    case RecurrencePolicy::WEEKLY:
        if (!task.anchor_time) {
            error = "missing scheduled_time";
            return false;
        }
        if (task.days_of_week.empty()) {
            error = "weekly task needs at least one day of week";
            return false;
        }
        for (int d : task.days_of_week) {
            if (d < 0 || d > 6) {
                error = "days_of_week entries must be between 0 (Monday) and 6 (Sunday)";
                return false;
            }
        }
        break;
    case RecurrencePolicy::MONTHLY:
        if (!task.anchor_time) {
            error = "missing scheduled_time";
            return false;
        }
        if (!task.day_of_month || *task.day_of_month < 1 || *task.day_of_month > 31) {
            error = "day_of_month must be between 1 and 31";
            return false;
        }
        break;
    case RecurrencePolicy::ADAPTIVE:
        // anchor is chosen by the usage analyzer when the task is added
        break;
    }
    return true;
}

// ─────────────────────────────────────
void RecordRun(Task &task, DateTime when) {
    if (!task.last_run || *task.last_run < when) {
        task.last_run = when;
    }
}

// ─────────────────────────────────────
nlohmann::json TaskToJson(const Task &task) {
    nlohmann::json j;
    j["task_id"] = task.id;
    j["name"] = task.name;
    j["path"] = task.target_path;
    j["instruction"] = task.instruction;
    j["schedule_type"] = PolicyName(task.policy);
    j["scheduled_time"] = task.anchor_time ? nlohmann::json(FormatDateTime(*task.anchor_time))
                                           : nlohmann::json(nullptr);
    j["days_of_week"] = task.days_of_week;
    j["day_of_month"] = task.day_of_month ? nlohmann::json(*task.day_of_month)
                                          : nlohmann::json(nullptr);
    j["resource_limit"] = task.resource_limit;
    j["priority"] = task.priority;
    j["last_run"] = task.last_run ? nlohmann::json(FormatDateTime(*task.last_run))
                                  : nlohmann::json(nullptr);
    j["enabled"] = task.enabled;
    j["created_at"] = task.created_at ? nlohmann::json(FormatDateTime(*task.created_at))
                                      : nlohmann::json(nullptr);
    return j;
}

// ─────────────────────────────────────
Task TaskFromJson(const nlohmann::json &j) {
    JsonParse parse;
    Task task;

    auto readTime = [&](const std::string &key) -> std::optional<DateTime> {
        std::string text = parse.GetString(j, key, "");
        if (text.empty()) {
            return std::nullopt;
        }
        auto t = ParseDateTime(text);
        if (!t) {
            spdlog::warn("Task: Unreadable {} '{}', ignoring it", key, text);
        }
        return t;
    };

    task.id = parse.GetString(j, "task_id", "");
    if (task.id.empty()) {
        task.id = GenerateTaskId();
    }
    task.name = parse.GetString(j, "name", "Untitled Task");
    task.target_path = parse.GetString(j, "path", "");
    task.instruction = parse.GetString(j, "instruction", "");

    std::string type = parse.GetString(j, "schedule_type", "once");
    auto policy = ParsePolicy(type);
    if (!policy) {
        spdlog::warn("Task: Unknown schedule_type '{}' for task {}, treating it as once", type,
                     task.id);
    }
    task.policy = policy.value_or(RecurrencePolicy::ONCE);

    task.anchor_time = readTime("scheduled_time");
    task.days_of_week = parse.GetIntArray(j, "days_of_week");
    if (j.contains("day_of_month") && j["day_of_month"].is_number()) {
        task.day_of_month = parse.GetInt(j, "day_of_month", 1);
    }
    task.resource_limit = parse.GetInt(j, "resource_limit", 50);
    task.priority = parse.GetInt(j, "priority", 1);
    task.last_run = readTime("last_run");
    task.enabled = parse.GetBool(j, "enabled", true);
    task.created_at = readTime("created_at");
    return task;
}
