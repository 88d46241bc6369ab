#include "Log.h"
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

static void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger,
                                     spdlog::level::level_enum level) {
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void logsys::init(const LogConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    if (cfg.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.file.empty()) {
        const fs::path path(cfg.file);
        std::error_code ec;
        if (path.has_parent_path())
            fs::create_directories(path.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
        } catch (const spdlog::spdlog_ex& e) {
            // Console-only is still a working logger.
            spdlog::warn("logsys: cannot open {}: {}", path.string(), e.what());
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.async_logging) {
        if (!spdlog::thread_pool())
            spdlog::init_thread_pool(8192, 1);

        logger = std::make_shared<spdlog::async_logger>(
            "powergrid", sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>("powergrid", sinks.begin(), sinks.end());
    }

    g_logger = logger;
    configure_default_logger(logger, cfg.level);
    spdlog::info("Logging started (level={}, async={})",
                 spdlog::level::to_string_view(cfg.level), cfg.async_logging);
}

void logsys::shutdown() {
    if (!g_logger)
        return;
    g_logger->flush();
    g_logger.reset();

    // Library code keeps logging through the default logger after world unload.
    configure_default_logger(
        std::make_shared<spdlog::logger>("", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()),
        spdlog::level::info);
}
