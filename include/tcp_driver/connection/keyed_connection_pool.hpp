#pragma once

#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "tcp_driver/config.hpp"
#include "tcp_driver/connection/connection.hpp"
#include "tcp_driver/connection/connection_pool.hpp"
#include "tcp_driver/connection/connection_pool_types.hpp"
#include "tcp_driver/endpoint.hpp"
#include "tcp_driver/result.hpp"

namespace tcp_driver {

    /**
     * Thread-safe blocking connection pool keyed by endpoint.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - Internal state protected by one mutex; waiters block on a condition
     *   variable that is notified whenever capacity or an idle connection
     *   becomes available
     * - New connections are opened outside the lock; their slot is reserved
     *   first so limits hold while connecting
     *
     * INVARIANTS:
     * 1. For each bucket: open == idle.size() + in_use.size() + connecting
     * 2. Global: total_open_ == sum(bucket open), same for idle and in use
     * 3. No connection exists in both idle and in_use
     * 4. total_open_ <= max_total_connections, bucket open <=
     *    max_connections_per_endpoint
     *
     * ERRORS:
     * - AcquisitionTimeout: nothing became available before the deadline
     * - ConnectionFailed/Timeout: the factory could not open a connection
     * - PoolClosed: close() was called, all future acquires fail
     *
     * LIFECYCLE:
     * 1. Construction: Pool is alive and ready
     * 2. Operation: acquire() and release()/invalidate() work normally
     * 3. close(): closes idle connections and wakes all waiters; connections
     *    still in use are closed when they come back
     * 4. Destruction: Calls close(). The pool must outlive every borrowed
     *    connection
     */
    class KeyedConnectionPool : public ConnectionPool {
       public:
        using clock_type = std::chrono::steady_clock;

        /// @brief Opens a new connection to an endpoint.
        using ConnectionFactory =
            std::function<Result<std::unique_ptr<Connection>>(
                const Endpoint&)>;

        /// @brief Pool of TcpConnections opened with cfg.connection.
        explicit KeyedConnectionPool(ConnectionPoolConfiguration cfg = {});

        /// @brief Pool of connections opened by factory.
        KeyedConnectionPool(ConnectionPoolConfiguration cfg,
                            ConnectionFactory factory);

        KeyedConnectionPool(const KeyedConnectionPool&) = delete;
        KeyedConnectionPool& operator=(const KeyedConnectionPool&) = delete;

        ~KeyedConnectionPool() override;

        Result<Connection*> acquire(const Endpoint& ep,
                                    std::chrono::milliseconds timeout) override;
        void release(const Endpoint& ep, Connection* conn) override;
        void invalidate(const Endpoint& ep, Connection* conn) override;
        void close() override;

        struct Stats {
            std::size_t total_open = 0;
            std::size_t total_idle = 0;
            std::size_t total_in_use = 0;
        };

        Stats stats() const;

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const noexcept {
            return metrics_;
        }

        const ConnectionPoolConfiguration& config() const noexcept {
            return cfg_;
        }

        bool is_closed() const;

       private:
        ///@brief Entry for an idle connection with health tracking
        struct IdleEntry {
            std::unique_ptr<Connection> conn;
            clock_type::time_point last_used;  ///< Last returned
            clock_type::time_point created;    ///< Creation time
            std::size_t reuse_count{0};        ///< Number of borrows
        };

        struct InUseEntry {
            std::unique_ptr<Connection> conn;
            clock_type::time_point created;
            std::size_t reuse_count{0};
        };

        ///@brief Per-endpoint bucket
        struct Bucket {
            std::deque<IdleEntry> idle;  ///< Oldest first
            std::unordered_map<Connection*, InUseEntry> in_use;
            std::size_t connecting{0};  ///< Slots reserved by open_ calls

            std::size_t open() const noexcept {
                return idle.size() + in_use.size() + connecting;
            }
        };

        /// @brief Borrow a usable idle connection from b, dropping stale ones
        Connection* take_idle_locked_(Bucket& b, clock_type::time_point now);

        /// @brief Close idle connections older than connection_idle_ttl
        void prune_idle_locked_(clock_type::time_point now);

        /// @brief Drop the least recently used idle connection of any bucket
        /// other than keep
        bool evict_idle_locked_(Bucket const* keep);

        /// @brief Open a connection into a reserved slot of b (unlocks lk)
        Result<Connection*> open_locked_(std::unique_lock<std::mutex>& lk,
                                         const Endpoint& ep, Bucket& b);

        /// @brief Remove conn from the in-use set of ep
        /// @return The entry, or an entry with a null conn if unknown
        InUseEntry take_in_use_locked_(const Endpoint& ep, Connection* conn);

        void publish_gauges_locked_();
        void check_invariants_locked_() const;

        ConnectionPoolConfiguration cfg_;
        std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;  ///< TLS only
        ConnectionFactory factory_;

        mutable std::mutex mu_;  ///< Protects everything below
        std::condition_variable cv_;
        std::unordered_map<Endpoint, Bucket> buckets_;  ///< Never erased

        std::size_t total_open_{0};
        std::size_t total_idle_{0};
        std::size_t total_in_use_{0};
        bool closed_{false};

        ConnectionPoolMetrics metrics_;
    };

}  // namespace tcp_driver
