#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "system_load.hpp"
#include "usage_store.hpp"

struct AnalyzerOptions {
    std::chrono::milliseconds sample_interval = std::chrono::minutes(5);
    std::chrono::milliseconds retry_backoff = std::chrono::minutes(1);
    int retention_days = 0; // 0 keeps every sample
};

class UsagePatternAnalyzer {
  public:
    static constexpr int kDefaultHour = 3;
    static constexpr int kDefaultMinute = 0;

    UsagePatternAnalyzer(std::unique_ptr<UsageStore> store, std::unique_ptr<LoadProbe> probe,
                         AnalyzerOptions options = {});
    ~UsagePatternAnalyzer();

    UsagePatternAnalyzer(const UsagePatternAnalyzer &) = delete;
    UsagePatternAnalyzer &operator=(const UsagePatternAnalyzer &) = delete;

    void StartCollecting();
    void StopCollecting();
    bool IsCollecting() const;

    // One sampling tick: read the probe and append a sample.
    bool CollectSample(std::string &error);

    // Lowest-load (hour, minute) seen on the current weekday, 03:00 without history.
    // required_resources is accepted for future weighting and does not change the pick.
    std::pair<int, int> FindOptimalTime(int required_resources = 30);
    std::pair<int, int> FindOptimalTime(int required_resources, int day_of_week);

    UsageReport Report();

    UsageStore &Store() {
        return *m_Store;
    }

  private:
    void Run();

    std::unique_ptr<UsageStore> m_Store;
    std::unique_ptr<LoadProbe> m_Probe;
    AnalyzerOptions m_Options;

    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    bool m_Collecting = false;
    bool m_StopRequested = false;
    std::thread m_Thread;
};
