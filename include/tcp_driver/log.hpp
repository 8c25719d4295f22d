#pragma once

#include <memory>
#include <spdlog/logger.h>

namespace tcp_driver::log {

    /// @brief Name under which the driver registers its default logger.
    inline constexpr const char* kLoggerName = "tcp_driver";

    /// @brief The logger every driver component writes to.
    /// @note Created on first use as a colored stdout logger unless a logger
    /// named kLoggerName is already registered with spdlog.
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Replace the driver logger (nullptr restores the default).
    void set_logger(std::shared_ptr<spdlog::logger> logger);

}  // namespace tcp_driver::log
