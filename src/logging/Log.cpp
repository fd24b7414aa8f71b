// src/logging/Log.cpp
#include "eldritch/logging/Log.h"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace eldritch::logsys {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

constexpr const char* kLoggerName = "eldritch";

} // namespace

void init(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!options.directory.empty())
    {
        std::error_code ec;
        fs::create_directories(options.directory, ec);
        const auto file = (fs::path(options.directory) / options.fileName).string();
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, options.maxFileBytes, options.maxFiles));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // Console logging stays up.
            spdlog::warn("eldritch: could not open log file '{}': {}", file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(options.level));
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    {
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_logger)
            spdlog::drop(kLoggerName);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);
    logger->info("Logging started (level={})", options.level);
}

std::shared_ptr<spdlog::logger> get()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger ? g_logger : spdlog::default_logger();
}

void shutdown()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger)
    {
        g_logger->flush();
        spdlog::drop(kLoggerName);
        g_logger.reset();
    }
    // drop() also cleared the default logger; late log calls still need one.
    if (!spdlog::default_logger())
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
}

} // namespace eldritch::logsys
