#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace brazier::logsys {
    // Rotating file log under `logDir` plus colored console output.
    // Installs the "brazier" logger as spdlog's default logger.
    void Init(const std::filesystem::path& logDir);
    void Shutdown();
}
