#include "task_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <unistd.h>

// ─────────────────────────────────────
TaskStore::TaskStore(std::filesystem::path path) : m_Path(std::move(path)) {}

// ─────────────────────────────────────
bool TaskStore::Load(std::vector<Task> &tasks, std::string &error) {
    tasks.clear();

    std::error_code ec;
    if (!std::filesystem::exists(m_Path, ec)) {
        spdlog::debug("TaskStore: {} does not exist yet, starting empty", m_Path.string());
        m_KnownWriteTime.reset();
        return true;
    }

    std::ifstream file(m_Path);
    if (!file.is_open()) {
        error = "unable to open " + m_Path.string();
        return false;
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(file);
    } catch (const std::exception &e) {
        error = std::string("invalid task file: ") + e.what();
        return false;
    }
    if (!data.is_array()) {
        error = "invalid task file: expected an array";
        return false;
    }

    for (const auto &entry : data) {
        if (!entry.is_object()) {
            spdlog::warn("TaskStore: Skipping non-object entry in {}", m_Path.string());
            continue;
        }
        tasks.push_back(TaskFromJson(entry));
    }
    m_KnownWriteTime = CurrentWriteTime();
    spdlog::debug("TaskStore: Loaded {} task(s) from {}", tasks.size(), m_Path.string());
    return true;
}

// ─────────────────────────────────────
bool TaskStore::Save(const std::vector<Task> &tasks, std::string &error) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto &task : tasks) {
        data.push_back(TaskToJson(task));
    }

    std::error_code ec;
    if (m_Path.has_parent_path()) {
        std::filesystem::create_directories(m_Path.parent_path(), ec);
        if (ec) {
            error = "unable to create " + m_Path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::filesystem::path tmp = m_Path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            error = "unable to write " + tmp.string();
            return false;
        }
        file << data.dump(2) << "\n";
        file.flush();
        if (!file) {
            error = "short write to " + tmp.string();
            return false;
        }
    }

    std::filesystem::rename(tmp, m_Path, ec);
    if (ec) {
        error = "unable to replace " + m_Path.string() + ": " + ec.message();
        std::filesystem::remove(tmp, ec);
        return false;
    }

    m_KnownWriteTime = CurrentWriteTime();
    return true;
}

// ─────────────────────────────────────
bool TaskStore::EnsureExists(std::string &error) {
    std::error_code ec;
    if (std::filesystem::exists(m_Path, ec)) {
        return true;
    }
    spdlog::info("TaskStore: Creating empty task list at {}", m_Path.string());
    return Save({}, error);
}

// ─────────────────────────────────────
bool TaskStore::IsAccessible() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(m_Path, ec)) {
        return false;
    }
    return access(m_Path.c_str(), R_OK | W_OK) == 0;
}

// ─────────────────────────────────────
bool TaskStore::ChangedOnDisk() const {
    return CurrentWriteTime() != m_KnownWriteTime;
}

// ─────────────────────────────────────
std::optional<std::filesystem::file_time_type> TaskStore::CurrentWriteTime() const {
    std::error_code ec;
    auto t = std::filesystem::last_write_time(m_Path, ec);
    if (ec) {
        return std::nullopt;
    }
    return t;
}
