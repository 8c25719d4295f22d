#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace tcp_driver {

    /**
     * @brief Live counters of a KeyedConnectionPool.
     *
     * Gauges mirror the pool state after every change; the remaining fields
     * only ever grow. All loads are relaxed, so a reader may see values from
     * slightly different moments.
     */
    struct ConnectionPoolMetrics {
        std::atomic<std::size_t> in_use{0};
        std::atomic<std::size_t> idle{0};
        std::atomic<std::size_t> waiting{0};  ///< Threads blocked in acquire()

        std::atomic<std::uint64_t> acquired{0};
        std::atomic<std::uint64_t> acquire_timeouts{0};
        std::atomic<std::uint64_t> rejected_closed{0};
        std::atomic<std::uint64_t> connect_failures{0};

        std::atomic<std::uint64_t> opened{0};
        std::atomic<std::uint64_t> reused{0};
        std::atomic<std::uint64_t> expired_idle{0};  ///< Past connection_idle_ttl
        std::atomic<std::uint64_t> evicted{0};  ///< Closed to make room elsewhere
        std::atomic<std::uint64_t> dropped_unhealthy{0};
        std::atomic<std::uint64_t> dropped_worn_out{0};  ///< Reuse limit hit
        std::atomic<std::uint64_t> dropped_too_old{0};   ///< Age limit hit

        std::atomic<std::uint64_t> released{0};
        std::atomic<std::uint64_t> invalidated{0};
        /// Connections handed to release() or invalidate() that the pool did
        /// not lend out.
        std::atomic<std::uint64_t> foreign_returns{0};
    };

}  // namespace tcp_driver
