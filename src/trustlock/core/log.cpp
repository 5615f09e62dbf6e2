#include <trustlock/core/log.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace trustlock::log {

    namespace {

        std::mutex &logger_mutex() {
            static std::mutex mutex;
            return mutex;
        }

    } // namespace

    std::shared_ptr<spdlog::logger> logger() {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        std::lock_guard<std::mutex> lock(logger_mutex());
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        return spdlog::stdout_color_mt(kLoggerName);
    }

    void set_logger(std::shared_ptr<spdlog::logger> replacement) {
        if (!replacement) {
            return;
        }
        std::lock_guard<std::mutex> lock(logger_mutex());
        spdlog::drop(kLoggerName);
        if (replacement->name() != kLoggerName) {
            replacement = replacement->clone(kLoggerName);
        }
        spdlog::register_logger(std::move(replacement));
    }

} // namespace trustlock::log
