#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Naive local wall-clock time. No zone or DST conversion is applied to it.
using DateTime = std::chrono::local_seconds;

DateTime LocalNow();
DateTime LocalFromUnix(std::int64_t seconds);
std::int64_t LocalToUnix(DateTime t);

DateTime MakeDateTime(int year, unsigned month, unsigned day, int hour = 0, int minute = 0,
                      int second = 0);
DateTime CombineDateTime(std::chrono::local_days day, std::chrono::seconds timeOfDay);
std::chrono::local_days DateOf(DateTime t);
std::chrono::seconds TimeOfDayOf(DateTime t);

// 0 = Monday ... 6 = Sunday
int WeekdayIndex(std::chrono::local_days day);
int HourOf(DateTime t);
int MinuteOf(DateTime t);

// Day `day` of the month, or the month's last day when it has fewer days.
std::chrono::local_days ClampedDay(std::chrono::year y, std::chrono::month m, int day);

std::string FormatDateTime(DateTime t);
std::optional<DateTime> ParseDateTime(const std::string &text);
std::optional<std::chrono::seconds> ParseTimeOfDay(const std::string &text);
