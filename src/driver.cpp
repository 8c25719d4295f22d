#include "tcp_driver/driver.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "tcp_driver/connection/keyed_connection_pool.hpp"
#include "tcp_driver/log.hpp"

namespace tcp_driver {

    namespace {
        /// Logs from noexcept paths; a failing logger is ignored there.
        void log_lease_failure(spdlog::level::level_enum level,
                               const char* what, const Endpoint& ep,
                               const char* reason) noexcept {
            try {
                log::logger()->log(level, "{} {}: {}", what, to_string(ep),
                                   reason);
            } catch (const std::exception&) {
                // Nowhere left to report it.
            }
        }

        /// Hands conn back to the pool exactly once. Unless release() was
        /// called, the connection is invalidated, also during unwinding.
        class Lease {
           public:
            Lease(ConnectionPool& pool, const Endpoint& ep, Connection* conn)
                : m_pool(pool), m_endpoint(ep), m_conn(conn) {}

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            ~Lease() { invalidate(); }

            void release() noexcept {
                if (!m_conn) return;
                auto* conn = std::exchange(m_conn, nullptr);
                try {
                    m_pool.release(m_endpoint, conn);
                } catch (const std::exception& e) {
                    // The operation already succeeded.
                    log_lease_failure(
                        spdlog::level::debug,
                        "Ignoring failure to release connection to",
                        m_endpoint, e.what());
                }
            }

            void invalidate() noexcept {
                if (!m_conn) return;
                auto* conn = std::exchange(m_conn, nullptr);
                try {
                    m_pool.invalidate(m_endpoint, conn);
                } catch (const std::exception& e) {
                    log_lease_failure(spdlog::level::warn,
                                      "Failed to invalidate connection to",
                                      m_endpoint, e.what());
                }
            }

           private:
            ConnectionPool& m_pool;
            const Endpoint& m_endpoint;
            Connection* m_conn;
        };

        std::optional<Error> run_operation(ConnectionPool& pool,
                                           const Endpoint& ep,
                                           Connection* conn,
                                           const detail::Operation& op) {
            Lease lease(pool, ep, conn);

            std::optional<Error> failure;
            try {
                failure = op(*conn);
            } catch (const std::exception& e) {
                failure = Error{Error::Code::OperationError,
                                "Operation on " + to_string(ep) +
                                    " threw: " + e.what()};
            }

            if (failure) {
                lease.invalidate();
                return failure;
            }
            lease.release();
            return std::nullopt;
        }

        Error no_connection_available(
            std::shared_ptr<const AttemptContext> last) {
            Error e{Error::Code::NoConnectionAvailable,
                    "No connection available: no endpoint to select"};
            if (last) {
                e.message += " after attempt " +
                             std::to_string(last->attempt_index) +
                             " against " + to_string(last->endpoint) +
                             " failed: " + last->cause.message;
                e.attempt = std::move(last);
            }
            return e;
        }
    }  // namespace

    namespace detail {

        std::optional<Error> select_send(const DriverContext& ctx,
                                         const std::optional<Endpoint>& target,
                                         const Operation& op,
                                         std::chrono::milliseconds timeout) {
            RoutingPolicy& routing = *ctx.routing_policy;
            ConnectionPool& pool = *ctx.pool;

            // Fixed at call start; hosts added meanwhile wait for the next
            // call.
            const std::size_t bound =
                std::max<std::size_t>(1, routing.hosts().size());

            std::shared_ptr<const AttemptContext> last;
            for (std::size_t i = 0; i < bound; ++i) {
                std::optional<Endpoint> ep =
                    target ? target : routing.select_host();
                if (!ep) return no_connection_available(std::move(last));

                std::optional<Error> cause;
                auto conn = pool.acquire(*ep, timeout);
                if (!conn) {
                    if (conn.error().code == Error::Code::PoolClosed)
                        return std::move(conn).error();
                    cause = std::move(conn).error();
                } else {
                    cause = run_operation(pool, *ep, conn.value(), op);
                    if (!cause) return std::nullopt;
                }

                routing.blacklist(*ep);
                routing.on_error(*ep, *cause);

                last = std::make_shared<const AttemptContext>(AttemptContext{
                    std::move(*cause), *ep, i, routing.hosts()});
            }

            Error failed{Error::Code::AttemptFailed,
                         "Attempt " + std::to_string(last->attempt_index) +
                             " against " + to_string(last->endpoint) +
                             " failed: " + last->cause.message};
            failed.attempt = std::move(last);
            return failed;
        }

    }  // namespace detail

    Driver::Driver(DriverContext ctx) {
        if (!ctx.pool || !ctx.routing_policy || !ctx.retry_policy) {
            throw std::invalid_argument(
                "DriverContext requires a pool, a routing policy and a retry "
                "policy");
        }
        m_ctx = std::make_shared<const DriverContext>(std::move(ctx));
    }

    Driver::Driver(DriverConfiguration cfg) {
        if (cfg.hosts.empty()) {
            throw std::invalid_argument("Driver requires at least one host");
        }

        const std::size_t host_count = cfg.hosts.size();
        DriverContext ctx;
        ctx.pool = std::make_shared<KeyedConnectionPool>(cfg.pool);
        ctx.routing_policy = std::make_shared<DefaultRoutingPolicy>(
            std::move(cfg.hosts), cfg.routing);
        ctx.retry_policy = std::make_shared<DefaultRetryPolicy>(cfg.retry);
        m_ctx = std::make_shared<const DriverContext>(std::move(ctx));

        log::logger()->info(
            "Driver created with {} host(s), up to {} connections, {} "
            "attempts per send",
            host_count, cfg.pool.max_total_connections,
            cfg.retry.max_attempts);
    }

    void Driver::add_host(const Endpoint& ep) {
        m_ctx->routing_policy->add_host(ep);
    }

    void Driver::remove_host(const Endpoint& ep) {
        m_ctx->routing_policy->remove_host(ep);
    }

    void Driver::blacklist_host(const Endpoint& ep) {
        m_ctx->routing_policy->blacklist(ep);
    }

    void Driver::unblacklist_host(const Endpoint& ep) {
        m_ctx->routing_policy->unblacklist(ep);
    }

    bool Driver::is_blacklisted(const Endpoint& ep) const {
        return m_ctx->routing_policy->is_blacklisted(ep);
    }

    std::vector<Endpoint> Driver::hosts() const {
        return m_ctx->routing_policy->hosts();
    }

    void Driver::close() {
        m_ctx->pool->close();
        log::logger()->info("Driver closed");
    }

}  // namespace tcp_driver
