#include "usage_analyzer.hpp"

#include "clock.hpp"
#include "common.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

// ─────────────────────────────────────
UsagePatternAnalyzer::UsagePatternAnalyzer(std::unique_ptr<UsageStore> store,
                                           std::unique_ptr<LoadProbe> probe,
                                           AnalyzerOptions options)
    : m_Store(std::move(store)), m_Probe(std::move(probe)), m_Options(options) {}

// ─────────────────────────────────────
UsagePatternAnalyzer::~UsagePatternAnalyzer() {
    StopCollecting();
}

// ─────────────────────────────────────
void UsagePatternAnalyzer::StartCollecting() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Collecting) {
        return;
    }
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    m_Collecting = true;
    m_StopRequested = false;
    m_Thread = std::thread([this]() { Run(); });
    spdlog::info("UsagePatternAnalyzer: Collecting system usage every {}s",
                 std::chrono::duration_cast<std::chrono::seconds>(m_Options.sample_interval).count());
}

// ─────────────────────────────────────
void UsagePatternAnalyzer::StopCollecting() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Collecting) {
            return;
        }
        m_StopRequested = true;
    }
    m_Cv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Collecting = false;
    }
    spdlog::info("UsagePatternAnalyzer: Collection stopped");
}

// ─────────────────────────────────────
bool UsagePatternAnalyzer::IsCollecting() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Collecting;
}

// ─────────────────────────────────────
void UsagePatternAnalyzer::Run() {
    std::unique_lock<std::mutex> lock(m_Mutex);
    while (!m_StopRequested) {
        lock.unlock();
        std::string error;
        bool ok = CollectSample(error);
        if (!ok) {
            spdlog::error("UsagePatternAnalyzer: Error collecting usage data: {}", error);
        } else if (m_Options.retention_days > 0) {
            std::int64_t cutoff = static_cast<std::int64_t>(std::time(nullptr)) -
                                  static_cast<std::int64_t>(m_Options.retention_days) * 86400;
            int pruned = m_Store->PruneOlderThan(cutoff);
            if (pruned > 0) {
                spdlog::debug("UsagePatternAnalyzer: Pruned {} old sample(s)", pruned);
            }
        }
        lock.lock();

        auto wait = ok ? m_Options.sample_interval : m_Options.retry_backoff;
        m_Cv.wait_for(lock, wait, [this]() { return m_StopRequested; });
    }
}

// ─────────────────────────────────────
bool UsagePatternAnalyzer::CollectSample(std::string &error) {
    if (!m_Probe) {
        error = "no load probe configured";
        return false;
    }

    std::optional<LoadReading> reading;
    try {
        reading = m_Probe->Read(error);
    } catch (const std::exception &e) {
        error = e.what();
        return false;
    }
    if (!reading) {
        if (error.empty()) {
            error = "load probe returned nothing";
        }
        return false;
    }

    UsageSample sample;
    sample.timestamp = static_cast<std::int64_t>(std::time(nullptr));
    const DateTime local = LocalFromUnix(sample.timestamp);
    sample.cpu_percent = reading->cpu_percent;
    sample.memory_percent = reading->memory_percent;
    sample.io_percent = reading->io_percent;
    sample.day_of_week = WeekdayIndex(DateOf(local));
    sample.hour = HourOf(local);
    sample.minute = MinuteOf(local);

    return m_Store->InsertSample(sample, error);
}

// ─────────────────────────────────────
std::pair<int, int> UsagePatternAnalyzer::FindOptimalTime(int required_resources) {
    return FindOptimalTime(required_resources, WeekdayIndex(DateOf(LocalNow())));
}

// ─────────────────────────────────────
std::pair<int, int> UsagePatternAnalyzer::FindOptimalTime(int required_resources,
                                                           int day_of_week) {
    auto slot = m_Store->LowestLoadSlot(day_of_week);
    if (!slot) {
        spdlog::info("UsagePatternAnalyzer: No usage history for {}, using {:02}:{:02}",
                     WeekdayName(day_of_week), kDefaultHour, kDefaultMinute);
        return {kDefaultHour, kDefaultMinute};
    }
    spdlog::info("UsagePatternAnalyzer: Optimal time for {} (needs {}%) is {:02}:{:02}, "
                 "average load {:.1f}% over {} sample(s)",
                 WeekdayName(day_of_week), required_resources, slot->hour, slot->minute,
                 slot->average_load, slot->samples);
    return {slot->hour, slot->minute};
}

// ─────────────────────────────────────
UsageReport UsagePatternAnalyzer::Report() {
    return m_Store->HourlyLoadByWeekday();
}
