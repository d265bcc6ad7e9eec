#include "eco/Log.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace {
std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        std::error_code ec;
        const fs::path dir = fs::path(logFile).parent_path();
        if (!dir.empty()) fs::create_directories(dir, ec);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 1 << 20, 4));
    }
    auto logger = std::make_shared<spdlog::logger>("eco", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    return logger;
}
} // namespace

namespace eco::logsys {

void init(spdlog::level::level_enum level, const std::string& logFile) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = make_logger(level, logFile);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) g_logger = make_logger(spdlog::level::info, {});
    return g_logger;
}

} // namespace eco::logsys
