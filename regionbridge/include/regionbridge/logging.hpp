#pragma once

#include <memory>
#include <mutex>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace regionbridge {

/// Name under which the library logger is registered with spdlog
inline constexpr const char* kLoggerName = "regionbridge";

namespace detail {
    struct LoggerHolder {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> logger;
    };

    inline LoggerHolder& logger_holder() {
        static LoggerHolder holder;
        return holder;
    }
} // namespace detail

/// @brief Library logger
/// @note Reuses a logger already registered under kLoggerName, otherwise
///       creates a colored stderr logger on first use
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    auto& holder = detail::logger_holder();
    std::lock_guard lock(holder.mutex);
    if (!holder.logger) {
        holder.logger = spdlog::get(kLoggerName);
        if (!holder.logger) {
            holder.logger = spdlog::stderr_color_mt(kLoggerName);
        }
    }
    return holder.logger;
}

/// @brief Route library messages to an application-provided logger
/// @param replacement New logger; nullptr restores the default on next use
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    auto& holder = detail::logger_holder();
    std::lock_guard lock(holder.mutex);
    holder.logger = std::move(replacement);
}

} // namespace regionbridge
