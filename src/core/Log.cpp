#include "core/Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void brazier::logsys::Init(const fs::path& logDir) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (!ec) {
        const auto file = (logDir / "brazier.log").string();
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
        } catch (const spdlog::spdlog_ex& e) {
            // Console-only logging is still usable.
            spdlog::warn("Could not open log file {}: {}", file, e.what());
        }
    }

    g_logger = std::make_shared<spdlog::logger>("brazier", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::info("Logging started");
}

void brazier::logsys::Shutdown() {
    if (g_logger)
        g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
}
