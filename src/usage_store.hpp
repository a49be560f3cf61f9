#pragma once

#include <sqlite3.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

struct UsageSample {
    std::int64_t timestamp = 0; // unix seconds
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    double io_percent = 0.0;
    int day_of_week = 0; // 0 = Monday
    int hour = 0;
    int minute = 0;
};

struct UsageSlot {
    int hour = 0;
    int minute = 0;
    double average_load = 0.0; // mean of cpu, memory and io averages
    int samples = 0;
};

// weekday (0 = Monday) -> hour -> average load
using UsageReport = std::map<int, std::map<int, double>>;

class UsageStore {
  public:
    explicit UsageStore(const std::filesystem::path &db_path);
    ~UsageStore();

    UsageStore(const UsageStore &) = delete;
    UsageStore &operator=(const UsageStore &) = delete;

    bool InsertSample(const UsageSample &sample, std::string &error);
    std::optional<UsageSlot> LowestLoadSlot(int day_of_week);
    UsageReport HourlyLoadByWeekday();
    int PruneOlderThan(std::int64_t cutoff);
    int CountSamples();

    const std::filesystem::path &Path() const {
        return m_DbPath;
    }

    static bool IsAccessible(const std::filesystem::path &db_path);

  private:
    void Init();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);

  private:
    sqlite3 *m_Db;
    std::filesystem::path m_DbPath;
    std::mutex m_Mutex;

    sqlite3_stmt *m_InsertSampleStmt = nullptr;

    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 64; // 8 KiB
    alignas(8) std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
