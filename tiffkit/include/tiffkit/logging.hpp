#pragma once

/**
 * @file logging.hpp
 * @brief Library-wide spdlog logger
 *
 * All diagnostics emitted by tiffkit go through a single named logger.
 * By default it is a colored stderr logger named "tiffkit" registered in
 * the spdlog registry on first use. Applications that route their logs
 * elsewhere can install their own logger with set_logger().
 *
 * @code{.cpp}
 * tiffkit::logger()->set_level(spdlog::level::debug);
 * @endcode
 */

#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tiffkit {

inline constexpr const char* logger_name = "tiffkit";

namespace logging_impl {

inline std::mutex& logger_mutex() noexcept {
    static std::mutex mutex;
    return mutex;
}

inline std::shared_ptr<spdlog::logger>& logger_slot() noexcept {
    static std::shared_ptr<spdlog::logger> slot;
    return slot;
}

} // namespace logging_impl

/// @brief Get the logger used by the library
/// @return Shared logger, created on first call if none was installed
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logging_impl::logger_mutex());
    auto& slot = logging_impl::logger_slot();
    if (!slot) {
        slot = spdlog::get(logger_name);
        if (!slot) {
            slot = spdlog::stderr_color_mt(logger_name);
            slot->set_level(spdlog::level::warn);
        }
    }
    return slot;
}

/// @brief Replace the logger used by the library
/// @param new_logger Logger to use from now on (nullptr restores the default)
inline void set_logger(std::shared_ptr<spdlog::logger> new_logger) {
    std::lock_guard<std::mutex> lock(logging_impl::logger_mutex());
    logging_impl::logger_slot() = std::move(new_logger);
}

} // namespace tiffkit
