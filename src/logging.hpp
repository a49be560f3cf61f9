#pragma once

#include <filesystem>

#include "common.hpp"

// Colored console plus a rotating file under `logs_dir` when it is not empty.
void SetupLogging(const std::filesystem::path &logs_dir, LogLevel level);
void SetLogLevel(LogLevel level);
