#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "task.hpp"

// Durable task list: one JSON array, rewritten whole on every save.
class TaskStore {
  public:
    explicit TaskStore(std::filesystem::path path);

    // A missing file is an empty list. Unreadable contents are reported through `error`.
    bool Load(std::vector<Task> &tasks, std::string &error);
    bool Save(const std::vector<Task> &tasks, std::string &error);

    // Creates an empty list on disk when the file is missing.
    bool EnsureExists(std::string &error);
    bool IsAccessible() const;

    // True when the file was rewritten since the last Load/Save through this object.
    bool ChangedOnDisk() const;

    const std::filesystem::path &Path() const {
        return m_Path;
    }

  private:
    std::optional<std::filesystem::file_time_type> CurrentWriteTime() const;

    std::filesystem::path m_Path;
    std::optional<std::filesystem::file_time_type> m_KnownWriteTime;
};
