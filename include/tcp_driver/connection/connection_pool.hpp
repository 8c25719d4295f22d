#pragma once

#include <chrono>

#include "tcp_driver/connection/connection.hpp"
#include "tcp_driver/endpoint.hpp"
#include "tcp_driver/result.hpp"

namespace tcp_driver {

    /**
     * Keyed pool of connections, one bucket per endpoint.
     *
     * The driver consumes this interface only; custom pools can be injected
     * through DriverContext. All methods must be thread-safe.
     *
     * CONTRACT:
     * - A connection returned by acquire() belongs to the caller until it is
     *   handed back with exactly one of release() or invalidate().
     * - release() may throw; the driver ignores such failures because the
     *   operation on the connection already succeeded.
     * - After close(), acquire() fails with PoolClosed.
     */
    class ConnectionPool {
       public:
        virtual ~ConnectionPool() = default;

        /// @brief Borrow a connection for ep, waiting up to timeout.
        /// @return The connection, or AcquisitionTimeout, ConnectionFailed,
        /// PoolClosed.
        [[nodiscard]] virtual Result<Connection*> acquire(
            const Endpoint& ep, std::chrono::milliseconds timeout) = 0;

        /// @brief Return a healthy connection for reuse.
        virtual void release(const Endpoint& ep, Connection* conn) = 0;

        /// @brief Discard a connection believed to be broken.
        virtual void invalidate(const Endpoint& ep, Connection* conn) = 0;

        /// @brief Release all pooled resources across all endpoints.
        virtual void close() = 0;
    };

}  // namespace tcp_driver
