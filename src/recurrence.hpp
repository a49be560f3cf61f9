#pragma once

#include <optional>

#include "clock.hpp"
#include "task.hpp"

// First occurrence of `task` strictly after `now`, or nullopt when it cannot run again.
std::optional<DateTime> NextRunTime(const Task &task, DateTime now);

// Occurrences are counted from the task's reference point: last_run, else created_at,
// else `now`. A later `last_attempt` (a run that did not succeed) moves the reference
// forward. A task is due when that occurrence is at or before `now`.
bool IsDue(const Task &task, DateTime now,
           std::optional<DateTime> last_attempt = std::nullopt);
