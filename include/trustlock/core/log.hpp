#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace trustlock::log {

    inline constexpr const char *kLoggerName = "trustlock";

    // Returns the "trustlock" logger, creating a stdout color logger on first use
    // unless the application already registered one under that name.
    std::shared_ptr<spdlog::logger> logger();

    // Replaces the library logger (e.g. with a file or null sink).
    void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace trustlock::log
