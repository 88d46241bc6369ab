#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logsys {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool        async_logging = true;              // file writes on spdlog's worker thread
    std::string file          = "logs/powergrid.log";
    bool        console       = true;
};

// Installs the "powergrid" logger as spdlog's default. Safe to call again;
// the previous logger is replaced.
void init(const LogConfig& cfg);

// Flushes and drops the logger; the default logger falls back to the console.
void shutdown();

} // namespace logsys
