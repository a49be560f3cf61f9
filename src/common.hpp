#pragma once

#include <string>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum class RecurrencePolicy { ONCE, DAILY, WEEKLY, MONTHLY, ADAPTIVE };

enum class Remediation { NONE, LOCAL_RESTART, FULL_RESET };

// 0 = Monday ... 6 = Sunday
inline const char *WeekdayName(int weekday) {
    static const char *names[] = {"Monday", "Tuesday",  "Wednesday", "Thursday",
                                  "Friday", "Saturday", "Sunday"};
    if (weekday < 0 || weekday > 6) {
        return "Unknown";
    }
    return names[weekday];
}

inline const char *RemediationName(Remediation r) {
    switch (r) {
    case Remediation::LOCAL_RESTART:
        return "local_restart";
    case Remediation::FULL_RESET:
        return "full_reset";
    default:
        return "none";
    }
}

LogLevel ParseLogLevel(const std::string &value, LogLevel fallback);
