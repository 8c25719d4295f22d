#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "tcp_driver/attempt.hpp"
#include "tcp_driver/config.hpp"
#include "tcp_driver/connection/connection.hpp"
#include "tcp_driver/connection/connection_pool.hpp"
#include "tcp_driver/endpoint.hpp"
#include "tcp_driver/error.hpp"
#include "tcp_driver/result.hpp"
#include "tcp_driver/retry_policy.hpp"
#include "tcp_driver/routing_policy.hpp"

namespace tcp_driver {

    /// @brief Acquisition timeout used when a send does not name one.
    inline constexpr std::chrono::milliseconds kDefaultAcquireTimeout{5000};

    /**
     * @brief The pool and policies every send runs against.
     *
     * Created once and shared by all callers; the members are never
     * reassigned, the objects they point to are thread-safe.
     */
    struct DriverContext {
        std::shared_ptr<ConnectionPool> pool;
        std::shared_ptr<RoutingPolicy> routing_policy;
        std::shared_ptr<RetryPolicy> retry_policy;
    };

    namespace detail {
        template <typename T>
        struct is_result : std::false_type {};

        template <typename T>
        struct is_result<Result<T>> : std::true_type {};

        /// @brief Type-erased operation; returns std::nullopt on success.
        using Operation = std::function<std::optional<Error>(Connection&)>;

        /// @brief Non-template core of select_send().
        std::optional<Error> select_send(const DriverContext& ctx,
                                         const std::optional<Endpoint>& target,
                                         const Operation& op,
                                         std::chrono::milliseconds timeout);
    }  // namespace detail

    /**
     * @brief Run op on a pooled connection, failing over across endpoints.
     *
     * Each attempt picks target (or, without one, a host chosen by the
     * routing policy), acquires a connection for it and runs op. On success
     * the connection is released and op's result returned. On failure (an
     * error result or a thrown std::exception) the connection is invalidated,
     * the endpoint blacklisted and reported through on_error, and another
     * attempt is made while fewer attempts than known hosts (at least one)
     * have been made.
     *
     * @param ctx Pool and policies.
     * @param target Explicit endpoint, or std::nullopt to let routing pick.
     * @param op Callable Connection& -> Result<T>.
     * @param timeout Acquisition timeout per attempt.
     * @return op's successful result; NoConnectionAvailable when no endpoint
     * can be selected; PoolClosed; or AttemptFailed with the context of the
     * last attempt.
     */
    template <typename Op>
    auto select_send(const DriverContext& ctx,
                     const std::optional<Endpoint>& target, Op&& op,
                     std::chrono::milliseconds timeout)
        -> std::invoke_result_t<Op&, Connection&> {
        using R = std::invoke_result_t<Op&, Connection&>;
        static_assert(detail::is_result<R>::value,
                      "operation must return a Result<T>");

        std::optional<R> result;
        auto err = detail::select_send(
            ctx, target,
            [&](Connection& conn) -> std::optional<Error> {
                result.emplace(op(conn));
                if (result->has_value()) return std::nullopt;
                return result->error();
            },
            timeout);

        if (err) return R::err(std::move(*err));
        return std::move(*result);
    }

    /// @brief select_send() repeated under ctx.retry_policy.
    template <typename Op>
    auto retry_send(const DriverContext& ctx,
                    const std::optional<Endpoint>& target, Op&& op,
                    std::chrono::milliseconds timeout)
        -> std::invoke_result_t<Op&, Connection&> {
        return ctx.retry_policy->with_retry(
            [&] { return select_send(ctx, target, op, timeout); });
    }

    /**
     * @brief Entry point for applications: owns a DriverContext and sends
     * operations through it.
     *
     * Thread-safe. Copies are not allowed; share the Driver itself or its
     * context.
     */
    class Driver {
       public:
        /// @brief Use a caller-assembled context.
        /// @throws std::invalid_argument if any member is null.
        explicit Driver(DriverContext ctx);

        /// @brief KeyedConnectionPool, DefaultRoutingPolicy and
        /// DefaultRetryPolicy built from cfg.
        /// @throws std::invalid_argument if cfg.hosts is empty.
        explicit Driver(DriverConfiguration cfg);

        Driver(const Driver&) = delete;
        Driver& operator=(const Driver&) = delete;

        /// @brief Run op against a host chosen by the routing policy.
        template <typename Op>
        auto send(Op&& op,
                  std::chrono::milliseconds timeout = kDefaultAcquireTimeout) {
            return retry_send(*m_ctx, std::nullopt, op, timeout);
        }

        /// @brief Run op against ep only.
        template <typename Op>
        auto send(const Endpoint& ep, Op&& op,
                  std::chrono::milliseconds timeout = kDefaultAcquireTimeout) {
            return retry_send(*m_ctx, std::optional<Endpoint>(ep), op,
                              timeout);
        }

        void add_host(const Endpoint& ep);
        void remove_host(const Endpoint& ep);
        void blacklist_host(const Endpoint& ep);
        void unblacklist_host(const Endpoint& ep);
        bool is_blacklisted(const Endpoint& ep) const;
        std::vector<Endpoint> hosts() const;

        /// @brief Close the pool; later sends fail with PoolClosed.
        void close();

        const DriverContext& context() const noexcept { return *m_ctx; }

       private:
        std::shared_ptr<const DriverContext> m_ctx;
    };

}  // namespace tcp_driver
