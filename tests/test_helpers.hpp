#pragma once

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir {
  public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "sortd-test-XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        m_Path = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_Path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &Path() const {
        return m_Path;
    }
    std::filesystem::path operator/(const std::string &name) const {
        return m_Path / name;
    }

  private:
    std::filesystem::path m_Path;
};
