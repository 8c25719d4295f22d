#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "tcp_driver/config.hpp"
#include "tcp_driver/error.hpp"
#include "tcp_driver/result.hpp"

namespace tcp_driver {

    /**
     * @brief Decides how often, and how far apart, a failed call is repeated.
     *
     * Implementations only see type-erased attempts; with_retry() adapts any
     * callable returning Result<T>.
     */
    class RetryPolicy {
       public:
        /// @brief One attempt; returns std::nullopt on success.
        using Attempt = std::function<std::optional<Error>()>;

        virtual ~RetryPolicy() = default;

        /// @brief Invoke attempt until it succeeds or the policy gives up.
        /// @return std::nullopt on success, otherwise the last error.
        [[nodiscard]] virtual std::optional<Error> run(
            const Attempt& attempt) = 0;

        /// @brief Retry f, a callable returning Result<T>, under this policy.
        /// @return The first successful result, or the last failed one.
        template <typename F>
        auto with_retry(F&& f) -> std::invoke_result_t<F&> {
            using R = std::invoke_result_t<F&>;
            std::optional<R> last;

            auto err = run([&]() -> std::optional<Error> {
                last.emplace(f());
                if (last->has_value()) return std::nullopt;
                return last->error();
            });

            // The policy may report an earlier failure than the last one.
            if (err) return R::err(std::move(*err));
            if (!last) {
                return R::err(Error{Error::Code::Unknown,
                                    "Retry policy made no attempt"});
            }
            return std::move(*last);
        }
    };

    /**
     * @brief Bounded retries with optional exponential backoff.
     *
     * At most max_attempts attempts are made in total. Errors whose root
     * cause is PoolClosed are returned immediately: a closed pool never
     * recovers. When a retry finds no endpoint left to select
     * (NoConnectionAvailable), the policy stops and returns the previous
     * error, which carries the failed attempt's context.
     */
    class DefaultRetryPolicy : public RetryPolicy {
       public:
        explicit DefaultRetryPolicy(RetryPolicyConfiguration cfg = {});

        std::optional<Error> run(const Attempt& attempt) override;

        /// @brief Delay before retry number n (1 = first retry).
        std::chrono::milliseconds backoff_for(std::size_t n) const noexcept;

        const RetryPolicyConfiguration& config() const noexcept {
            return cfg_;
        }

       protected:
        /// @brief Whether a failed attempt may be repeated at all.
        virtual bool is_retryable(const Error& e) const noexcept;

       private:
        RetryPolicyConfiguration cfg_;
    };

}  // namespace tcp_driver
