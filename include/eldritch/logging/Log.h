// include/eldritch/logging/Log.h
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace eldritch::logsys {

struct LogOptions
{
    std::string level     = "info";   // spdlog level name: trace/debug/info/warn/err/critical/off
    std::string directory;            // empty: console only
    std::string fileName  = "eldritch.log";
    std::size_t maxFileBytes = 1u << 20; // 1 MiB
    std::size_t maxFiles     = 4;
    bool        console      = true;
};

// Builds the "eldritch" logger (console + optional rotating file) and installs
// it as spdlog's default. Safe to call again to reconfigure.
void init(const LogOptions& options = {});

// The installed logger, or spdlog's default logger before init().
std::shared_ptr<spdlog::logger> get();

void shutdown();

} // namespace eldritch::logsys
