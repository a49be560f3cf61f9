#include "clock.hpp"

#include <cstdio>
#include <ctime>

namespace {

// ─────────────────────────────────────
DateTime FromTm(const std::tm &tm) {
    return MakeDateTime(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                        static_cast<unsigned>(tm.tm_mday), tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // namespace

// ─────────────────────────────────────
DateTime LocalNow() {
    return LocalFromUnix(static_cast<std::int64_t>(std::time(nullptr)));
}

// ─────────────────────────────────────
DateTime LocalFromUnix(std::int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    localtime_r(&t, &tm);
    return FromTm(tm);
}

// ─────────────────────────────────────
std::int64_t LocalToUnix(DateTime t) {
    const std::chrono::year_month_day ymd{DateOf(t)};
    const std::chrono::hh_mm_ss hms{TimeOfDayOf(t)};

    std::tm tm{};
    tm.tm_year = static_cast<int>(ymd.year()) - 1900;
    tm.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
    tm.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
    tm.tm_hour = static_cast<int>(hms.hours().count());
    tm.tm_min = static_cast<int>(hms.minutes().count());
    tm.tm_sec = static_cast<int>(hms.seconds().count());
    tm.tm_isdst = -1;
    return static_cast<std::int64_t>(std::mktime(&tm));
}

// ─────────────────────────────────────
DateTime MakeDateTime(int year, unsigned month, unsigned day, int hour, int minute, int second) {
    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                          std::chrono::day{day}};
    return CombineDateTime(std::chrono::local_days{ymd}, std::chrono::hours{hour} +
                                                             std::chrono::minutes{minute} +
                                                             std::chrono::seconds{second});
}

// ─────────────────────────────────────
DateTime CombineDateTime(std::chrono::local_days day, std::chrono::seconds timeOfDay) {
    return DateTime{day.time_since_epoch()} + timeOfDay;
}

// ─────────────────────────────────────
std::chrono::local_days DateOf(DateTime t) {
    return std::chrono::floor<std::chrono::days>(t);
}

// ─────────────────────────────────────
std::chrono::seconds TimeOfDayOf(DateTime t) {
    return t - DateTime{DateOf(t).time_since_epoch()};
}

// ─────────────────────────────────────
int WeekdayIndex(std::chrono::local_days day) {
    // iso_encoding: Monday = 1 ... Sunday = 7
    return static_cast<int>(std::chrono::weekday{day}.iso_encoding()) - 1;
}

// ─────────────────────────────────────
int HourOf(DateTime t) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::hours>(TimeOfDayOf(t)).count());
}

// ─────────────────────────────────────
int MinuteOf(DateTime t) {
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::minutes>(TimeOfDayOf(t)).count() % 60);
}

// ─────────────────────────────────────
std::chrono::local_days ClampedDay(std::chrono::year y, std::chrono::month m, int day) {
    const std::chrono::year_month_day_last last{y, std::chrono::month_day_last{m}};
    const unsigned lastDay = static_cast<unsigned>(last.day());
    unsigned d = day < 1 ? 1u : static_cast<unsigned>(day);
    if (d > lastDay) {
        d = lastDay;
    }
    return std::chrono::local_days{std::chrono::year_month_day{y, m, std::chrono::day{d}}};
}

// ─────────────────────────────────────
std::string FormatDateTime(DateTime t) {
    const std::chrono::year_month_day ymd{DateOf(t)};
    const std::chrono::hh_mm_ss hms{TimeOfDayOf(t)};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return buf;
}

// ─────────────────────────────────────
std::optional<DateTime> ParseDateTime(const std::string &text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    char sep = 0;

    // Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM", "YYYY-MM-DD HH:MM:SS[.ffffff]"
    int n = std::sscanf(text.c_str(), "%d-%u-%u%c%d:%d:%d", &year, &month, &day, &sep, &hour,
                        &minute, &second);
    if (n != 3 && n < 6) {
        return std::nullopt;
    }
    if (n >= 4 && sep != 'T' && sep != ' ') {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        return std::nullopt;
    }
    return MakeDateTime(year, month, day, hour, minute, second);
}

// ─────────────────────────────────────
std::optional<std::chrono::seconds> ParseTimeOfDay(const std::string &text) {
    int hour = 0;
    int minute = 0;
    int second = 0;
    int n = std::sscanf(text.c_str(), "%d:%d:%d", &hour, &minute, &second);
    if (n < 2) {
        return std::nullopt;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        return std::nullopt;
    }
    return std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second};
}
