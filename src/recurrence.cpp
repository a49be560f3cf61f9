#include "recurrence.hpp"

#include <algorithm>
#include <vector>

namespace {

// ─────────────────────────────────────
std::optional<DateTime> NextDaily(std::chrono::seconds timeOfDay, DateTime now) {
    DateTime next = CombineDateTime(DateOf(now), timeOfDay);
    if (next <= now) {
        next += std::chrono::days{1};
    }
    return next;
}

// ─────────────────────────────────────
std::optional<DateTime> NextWeekly(const std::vector<int> &days, std::chrono::seconds timeOfDay,
                                   DateTime now) {
    std::vector<int> sorted;
    for (int d : days) {
        if (d >= 0 && d <= 6) {
            sorted.push_back(d);
        }
    }
    if (sorted.empty()) {
        return std::nullopt;
    }
    std::sort(sorted.begin(), sorted.end());

    const std::chrono::local_days today = DateOf(now);
    const int weekday = WeekdayIndex(today);

    auto search = [&](bool includeToday) -> std::optional<int> {
        for (int d : sorted) {
            if (d > weekday || (includeToday && d == weekday)) {
                return d - weekday;
            }
        }
        return std::nullopt;
    };

    std::optional<int> daysAhead = search(true);
    if (daysAhead && *daysAhead == 0 && CombineDateTime(today, timeOfDay) <= now) {
        daysAhead = search(false);
    }
    if (!daysAhead) {
        daysAhead = 7 - weekday + sorted.front();
    }
    return CombineDateTime(today + std::chrono::days{*daysAhead}, timeOfDay);
}

// ─────────────────────────────────────
std::optional<DateTime> NextMonthly(int dayOfMonth, std::chrono::seconds timeOfDay, DateTime now) {
    if (dayOfMonth < 1 || dayOfMonth > 31) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{DateOf(now)};
    DateTime next = CombineDateTime(ClampedDay(ymd.year(), ymd.month(), dayOfMonth), timeOfDay);
    if (next <= now) {
        const std::chrono::year_month following =
            std::chrono::year_month{ymd.year(), ymd.month()} + std::chrono::months{1};
        next = CombineDateTime(ClampedDay(following.year(), following.month(), dayOfMonth),
                               timeOfDay);
    }
    return next;
}

} // namespace

// ─────────────────────────────────────
std::optional<DateTime> NextRunTime(const Task &task, DateTime now) {
    if (!task.enabled || !task.anchor_time) {
        return std::nullopt;
    }

    const std::chrono::seconds timeOfDay = TimeOfDayOf(*task.anchor_time);

    switch (task.policy) {
    case RecurrencePolicy::ONCE:
        if (*task.anchor_time > now) {
            return task.anchor_time;
        }
        return std::nullopt;
    case RecurrencePolicy::DAILY:
    case RecurrencePolicy::ADAPTIVE:
        return NextDaily(timeOfDay, now);
    case RecurrencePolicy::WEEKLY:
        return NextWeekly(task.days_of_week, timeOfDay, now);
    case RecurrencePolicy::MONTHLY:
        if (!task.day_of_month) {
            return std::nullopt;
        }
        return NextMonthly(*task.day_of_month, timeOfDay, now);
    }
    return std::nullopt;
}

// ─────────────────────────────────────
bool IsDue(const Task &task, DateTime now, std::optional<DateTime> last_attempt) {
    DateTime reference = now;
    if (task.last_run) {
        reference = *task.last_run;
    } else if (task.created_at) {
        reference = *task.created_at;
    }
    if (last_attempt && *last_attempt > reference) {
        reference = *last_attempt;
    }
    if (reference > now) {
        return false;
    }

    auto next = NextRunTime(task, reference);
    return next && *next <= now;
}
