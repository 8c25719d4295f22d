#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "endpoint.hpp"

namespace tcp_driver {
    /**
     * @brief Options applied to every TCP connection the default pool opens.
     */
    struct ConnectionOptions {
        /**
         * @brief Timeout for the TCP connect and the TLS handshake.
         * @note Name resolution is synchronous and only bounded by the
         * system resolver.
         */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Timeout for each read or write; zero disables it. */
        std::chrono::milliseconds io_timeout{30000};

        /** @brief Whether to wrap connections in TLS. */
        bool tls{false};

        /** @brief Whether to verify the peer certificate and host name. */
        bool verify_tls{true};

        /** @brief Set TCP_NODELAY on connected sockets. */
        bool tcp_no_delay{true};

        /** @brief Set SO_KEEPALIVE on connected sockets. */
        bool keep_alive{true};
    };

    /**
     * @brief Configuration for the default keyed connection pool.
     */
    struct ConnectionPoolConfiguration {
        /** @brief Maximum total connections in the pool. */
        size_t max_total_connections{16};
        /** @brief Maximum connections per endpoint (host:port). */
        size_t max_connections_per_endpoint{4};
        /** @brief Idle connection time-to-live; zero disables pruning. */
        std::chrono::milliseconds connection_idle_ttl{30000};

        /** @brief Max borrows of one connection before it is discarded. */
        size_t max_connection_reuse_count{1000};

        /** @brief Max lifetime of any single connection; zero disables it. */
        std::chrono::milliseconds max_connection_age{300000};

        /** @brief Check that idle connections are still open on borrow. */
        bool test_on_borrow{true};

        /** @brief Options for the connections the pool opens. */
        ConnectionOptions connection;
    };

    /**
     * @brief Configuration for the default routing policy.
     */
    struct RoutingPolicyConfiguration {
        /**
         * @brief How long a blacklisted endpoint stays excluded; zero keeps
         * it blacklisted until explicitly removed.
         */
        std::chrono::milliseconds blacklist_ttl{0};

        /** @brief Seed for host selection; random when unset. */
        std::optional<std::uint64_t> seed;
    };

    /**
     * @brief Configuration for the default retry policy.
     */
    struct RetryPolicyConfiguration {
        /** @brief Total attempts of a send, the first one included. */
        size_t max_attempts{10};

        /** @brief Delay before the first retry; zero retries immediately. */
        std::chrono::milliseconds initial_backoff{0};

        /** @brief Factor applied to the delay after every retry. */
        double backoff_multiplier{2.0};

        /** @brief Upper bound for the delay between retries. */
        std::chrono::milliseconds max_backoff{1000};
    };

    /**
     * @brief Everything needed to build a driver with the default pool,
     * routing and retry policies.
     */
    struct DriverConfiguration {
        /** @brief Equivalent server endpoints; must not be empty. */
        std::vector<Endpoint> hosts;

        RoutingPolicyConfiguration routing;
        ConnectionPoolConfiguration pool;
        RetryPolicyConfiguration retry;
    };
}  // namespace tcp_driver
