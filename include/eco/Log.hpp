#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace eco::logsys {
    // Console logger "eco"; when logFile is non-empty a rotating file sink
    // (1MB * 4) is attached as well. Safe to call more than once.
    void init(spdlog::level::level_enum level = spdlog::level::info,
              const std::string& logFile = {});

    // The "eco" logger; created with defaults on first use.
    std::shared_ptr<spdlog::logger> get();
}
