#include "tcp_driver/log.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tcp_driver::log {

    namespace {
        std::mutex g_mu;
        std::shared_ptr<spdlog::logger> g_logger;

        std::shared_ptr<spdlog::logger> make_default_logger() {
            if (auto existing = spdlog::get(kLoggerName)) return existing;
            try {
                return spdlog::stdout_color_mt(kLoggerName);
            } catch (const spdlog::spdlog_ex&) {
                // Registered concurrently by someone else.
                return spdlog::get(kLoggerName);
            }
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lk(g_mu);
        if (!g_logger) g_logger = make_default_logger();
        return g_logger;
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger) {
        std::lock_guard<std::mutex> lk(g_mu);
        g_logger = std::move(logger);
    }

}  // namespace tcp_driver::log
