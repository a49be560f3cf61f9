#pragma once

#include <chrono>
#include <optional>
#include <string>

struct LoadReading {
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    double io_percent = 0.0;
};

class LoadProbe {
  public:
    virtual ~LoadProbe() = default;

    // nullopt when the system counters cannot be read; `error` says why.
    virtual std::optional<LoadReading> Read(std::string &error) = 0;
};

// Reads /proc/stat, /proc/meminfo and /proc/diskstats. CPU and IO are utilization
// since the previous call; the first call measures over a short window.
class ProcLoadProbe : public LoadProbe {
  public:
    explicit ProcLoadProbe(std::chrono::milliseconds firstWindow = std::chrono::seconds(1));

    std::optional<LoadReading> Read(std::string &error) override;

  private:
    struct CpuTimes {
        unsigned long long idle = 0;
        unsigned long long total = 0;
    };

    bool ReadCpuTimes(CpuTimes &times, std::string &error) const;
    bool ReadMemoryPercent(double &percent, std::string &error) const;
    bool ReadIoBusyMs(unsigned long long &busyMs) const;

    std::chrono::milliseconds m_FirstWindow;
    bool m_HasPrevious = false;
    CpuTimes m_PrevCpu;
    unsigned long long m_PrevIoBusyMs = 0;
    std::chrono::steady_clock::time_point m_PrevAt;
};
