#include <catch2/catch.hpp>

#include "recurrence.hpp"

using namespace std::chrono;

namespace {

Task MakeTask(RecurrencePolicy policy, DateTime anchor) {
    Task task;
    task.id = "t";
    task.policy = policy;
    task.anchor_time = anchor;
    return task;
}

} // namespace

// 2025-03-03 is a Monday.

TEST_CASE("Once runs only while its anchor is ahead", "[recurrence]") {
    Task task = MakeTask(RecurrencePolicy::ONCE, MakeDateTime(2025, 3, 5, 12, 0));

    CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 11, 0)) == MakeDateTime(2025, 3, 5, 12, 0));
    CHECK_FALSE(NextRunTime(task, MakeDateTime(2025, 3, 5, 12, 0)).has_value());

    SECTION("a past anchor with no history is never due") {
        const DateTime now = MakeDateTime(2025, 3, 6, 8, 0);
        CHECK_FALSE(NextRunTime(task, now).has_value());
        CHECK_FALSE(IsDue(task, now));
    }

    SECTION("created before the anchor it becomes due once") {
        task.created_at = MakeDateTime(2025, 3, 1, 10, 0);
        const DateTime now = MakeDateTime(2025, 3, 5, 12, 0, 5);
        CHECK(IsDue(task, now));
        RecordRun(task, now);
        CHECK_FALSE(IsDue(task, now));
        CHECK_FALSE(IsDue(task, MakeDateTime(2026, 1, 1)));
    }
}

TEST_CASE("Daily picks today or tomorrow", "[recurrence]") {
    Task task = MakeTask(RecurrencePolicy::DAILY, MakeDateTime(2025, 1, 1, 2, 0));

    CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 1, 0)) == MakeDateTime(2025, 3, 5, 2, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 2, 0)) == MakeDateTime(2025, 3, 6, 2, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 12, 31, 3, 0)) == MakeDateTime(2026, 1, 1, 2, 0));

    SECTION("the next run is within one day of now") {
        for (int h = 0; h < 24; ++h) {
            const DateTime now = MakeDateTime(2025, 3, 5, h, 30);
            auto next = NextRunTime(task, now);
            REQUIRE(next.has_value());
            CHECK(*next > now);
            CHECK(*next - days{1} <= now);
        }
    }

    SECTION("the result does not depend on call count") {
        const DateTime now = MakeDateTime(2025, 3, 5, 14, 0);
        CHECK(NextRunTime(task, now) == NextRunTime(task, now));
    }
}

TEST_CASE("Weekly searches the configured days", "[recurrence]") {
    Task task = MakeTask(RecurrencePolicy::WEEKLY, MakeDateTime(2025, 1, 1, 9, 0));
    task.days_of_week = {2}; // Wednesday

    SECTION("later the same week") {
        CHECK(NextRunTime(task, MakeDateTime(2025, 3, 4, 8, 0)) == MakeDateTime(2025, 3, 5, 9, 0));
    }
    SECTION("today before the time") {
        CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 8, 0)) == MakeDateTime(2025, 3, 5, 9, 0));
    }
    SECTION("today after the time wraps to next week") {
        CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 10, 0)) ==
              MakeDateTime(2025, 3, 12, 9, 0));
    }
    SECTION("several days pick the soonest remaining one") {
        task.days_of_week = {4, 0, 2};
        CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 10, 0)) ==
              MakeDateTime(2025, 3, 7, 9, 0));
        CHECK(NextRunTime(task, MakeDateTime(2025, 3, 7, 10, 0)) ==
              MakeDateTime(2025, 3, 10, 9, 0));
    }
    SECTION("no days means no run") {
        task.days_of_week.clear();
        CHECK_FALSE(NextRunTime(task, MakeDateTime(2025, 3, 5, 8, 0)).has_value());
    }
}

TEST_CASE("Monthly clamps to the end of short months", "[recurrence]") {
    Task task = MakeTask(RecurrencePolicy::MONTHLY, MakeDateTime(2025, 1, 1, 4, 0));
    task.day_of_month = 31;

    CHECK(NextRunTime(task, MakeDateTime(2025, 2, 10)) == MakeDateTime(2025, 2, 28, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2024, 2, 10)) == MakeDateTime(2024, 2, 29, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 4, 1)) == MakeDateTime(2025, 4, 30, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 5, 31, 5, 0)) == MakeDateTime(2025, 6, 30, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 6, 30, 5, 0)) == MakeDateTime(2025, 7, 31, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 8, 31, 5, 0)) == MakeDateTime(2025, 9, 30, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 11, 2)) == MakeDateTime(2025, 11, 30, 4, 0));
    CHECK(NextRunTime(task, MakeDateTime(2025, 12, 31, 5, 0)) == MakeDateTime(2026, 1, 31, 4, 0));

    SECTION("a missing day never runs") {
        task.day_of_month.reset();
        CHECK_FALSE(NextRunTime(task, MakeDateTime(2025, 2, 10)).has_value());
    }
}

TEST_CASE("Adaptive behaves like daily once its time is frozen", "[recurrence]") {
    Task task = MakeTask(RecurrencePolicy::ADAPTIVE, MakeDateTime(2025, 1, 1, 3, 15));
    CHECK(NextRunTime(task, MakeDateTime(2025, 3, 5, 4, 0)) == MakeDateTime(2025, 3, 6, 3, 15));

    task.anchor_time.reset();
    CHECK_FALSE(NextRunTime(task, MakeDateTime(2025, 3, 5, 4, 0)).has_value());
}

TEST_CASE("Due-ness is measured from the last run", "[recurrence]") {
    Task task = MakeTask(RecurrencePolicy::DAILY, MakeDateTime(2025, 1, 1, 2, 0));
    task.created_at = MakeDateTime(2025, 3, 4, 12, 0);

    CHECK_FALSE(IsDue(task, MakeDateTime(2025, 3, 5, 1, 59)));
    CHECK(IsDue(task, MakeDateTime(2025, 3, 5, 2, 0)));

    SECTION("several missed occurrences catch up with one run") {
        const DateTime now = MakeDateTime(2025, 3, 9, 12, 0);
        CHECK(IsDue(task, now));
        RecordRun(task, now);
        CHECK_FALSE(IsDue(task, now));
        CHECK_FALSE(IsDue(task, MakeDateTime(2025, 3, 10, 1, 0)));
        CHECK(IsDue(task, MakeDateTime(2025, 3, 10, 2, 0)));
    }

    SECTION("disabled tasks are never due") {
        task.enabled = false;
        CHECK_FALSE(IsDue(task, MakeDateTime(2025, 3, 9, 12, 0)));
        CHECK_FALSE(NextRunTime(task, MakeDateTime(2025, 3, 9, 12, 0)).has_value());
    }

    SECTION("a task without history is not due right away") {
        task.created_at.reset();
        CHECK_FALSE(IsDue(task, MakeDateTime(2025, 3, 5, 2, 0)));
    }
}
