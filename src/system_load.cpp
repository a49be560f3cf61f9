#include "system_load.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <thread>

namespace {

// Whole disks only; partitions would count the same IO twice.
bool IsWholeDisk(const std::string &name) {
    if (name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0 || name.rfind("zram", 0) == 0) {
        return false;
    }
    if (name.rfind("nvme", 0) == 0 || name.rfind("mmcblk", 0) == 0) {
        return name.find('p', name.find_first_of("0123456789")) == std::string::npos;
    }
    return !name.empty() && !std::isdigit(static_cast<unsigned char>(name.back()));
}

} // namespace

// ─────────────────────────────────────
ProcLoadProbe::ProcLoadProbe(std::chrono::milliseconds firstWindow) : m_FirstWindow(firstWindow) {}

// ─────────────────────────────────────
std::optional<LoadReading> ProcLoadProbe::Read(std::string &error) {
    if (!m_HasPrevious) {
        if (!ReadCpuTimes(m_PrevCpu, error)) {
            return std::nullopt;
        }
        m_PrevIoBusyMs = 0;
        ReadIoBusyMs(m_PrevIoBusyMs);
        m_PrevAt = std::chrono::steady_clock::now();
        m_HasPrevious = true;
        std::this_thread::sleep_for(m_FirstWindow);
    }

    CpuTimes cpu;
    if (!ReadCpuTimes(cpu, error)) {
        return std::nullopt;
    }

    LoadReading reading;
    if (!ReadMemoryPercent(reading.memory_percent, error)) {
        return std::nullopt;
    }

    const unsigned long long idleDelta = cpu.idle - m_PrevCpu.idle;
    const unsigned long long totalDelta = cpu.total - m_PrevCpu.total;
    if (totalDelta > 0) {
        double usage = 1.0 - static_cast<double>(idleDelta) / static_cast<double>(totalDelta);
        reading.cpu_percent = std::clamp(usage, 0.0, 1.0) * 100.0;
    }
    m_PrevCpu = cpu;

    // %util as iostat reports it: time the disks were busy over wall time elapsed.
    const auto now = std::chrono::steady_clock::now();
    const double elapsedMs =
        std::chrono::duration<double, std::milli>(now - m_PrevAt).count();
    unsigned long long busyMs = 0;
    if (ReadIoBusyMs(busyMs)) {
        if (elapsedMs > 0.0 && busyMs >= m_PrevIoBusyMs) {
            double util = static_cast<double>(busyMs - m_PrevIoBusyMs) / elapsedMs * 100.0;
            reading.io_percent = std::clamp(util, 0.0, 100.0);
        }
        m_PrevIoBusyMs = busyMs;
    }
    m_PrevAt = now;

    spdlog::debug("ProcLoadProbe: cpu={:.1f}% mem={:.1f}% io={:.1f}%", reading.cpu_percent,
                  reading.memory_percent, reading.io_percent);
    return reading;
}

// ─────────────────────────────────────
bool ProcLoadProbe::ReadCpuTimes(CpuTimes &times, std::string &error) const {
    std::ifstream file("/proc/stat");
    if (!file.is_open()) {
        error = "failed to open /proc/stat";
        return false;
    }

    std::string line;
    std::getline(file, line);

    std::istringstream iss(line);
    std::string cpu;
    unsigned long long user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0,
                       softirq = 0, steal = 0;
    iss >> cpu >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    if (cpu != "cpu") {
        error = "unexpected /proc/stat layout";
        return false;
    }

    times.idle = idle + iowait;
    times.total = user + nice + system + idle + iowait + irq + softirq + steal;
    return true;
}

// ─────────────────────────────────────
bool ProcLoadProbe::ReadMemoryPercent(double &percent, std::string &error) const {
    std::ifstream file("/proc/meminfo");
    if (!file.is_open()) {
        error = "failed to open /proc/meminfo";
        return false;
    }

    std::string line;
    unsigned long long totalKb = 0;
    unsigned long long availableKb = 0;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string key;
        unsigned long long value = 0;
        iss >> key >> value;
        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
        }
        if (totalKb > 0 && availableKb > 0) {
            break;
        }
    }

    if (totalKb == 0) {
        error = "MemTotal missing from /proc/meminfo";
        return false;
    }
    percent = (1.0 - static_cast<double>(availableKb) / static_cast<double>(totalKb)) * 100.0;
    percent = std::clamp(percent, 0.0, 100.0);
    return true;
}

// ─────────────────────────────────────
bool ProcLoadProbe::ReadIoBusyMs(unsigned long long &busyMs) const {
    std::ifstream file("/proc/diskstats");
    if (!file.is_open()) {
        return false;
    }

    // major minor name reads rmerged rsectors rms writes wmerged wsectors wms inflight io_ms ...
    unsigned long long total = 0;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        unsigned major = 0, minor = 0;
        std::string name;
        unsigned long long f[10] = {};
        iss >> major >> minor >> name;
        for (auto &v : f) {
            iss >> v;
        }
        if (!iss || !IsWholeDisk(name)) {
            continue;
        }
        total += f[9];
    }
    busyMs = total;
    return true;
}
