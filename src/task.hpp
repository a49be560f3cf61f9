#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "common.hpp"

// The policy tag decides which of anchor_time, days_of_week and day_of_month is read.
// The others are carried along untouched so a later policy switch can use them.
struct Task {
    std::string id;
    std::string name = "Untitled Task";
    std::string target_path;
    std::string instruction;
    RecurrencePolicy policy = RecurrencePolicy::ONCE;
    std::optional<DateTime> anchor_time;
    std::vector<int> days_of_week; // 0 = Monday ... 6 = Sunday
    std::optional<int> day_of_month;
    int resource_limit = 50;
    int priority = 1;
    std::optional<DateTime> last_run;
    bool enabled = true;
    std::optional<DateTime> created_at;

    bool operator==(const Task &other) const = default;
};

std::string PolicyName(RecurrencePolicy policy);
std::optional<RecurrencePolicy> ParsePolicy(const std::string &name);

std::string GenerateTaskId();

// Checks only the fields the current policy reads.
bool ValidateTask(const Task &task, std::string &error);

// last_run never moves backward.
void RecordRun(Task &task, DateTime when);

nlohmann::json TaskToJson(const Task &task);
Task TaskFromJson(const nlohmann::json &j);
