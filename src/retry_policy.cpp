#include "tcp_driver/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <thread>

#include "tcp_driver/attempt.hpp"
#include "tcp_driver/log.hpp"

namespace tcp_driver {

    DefaultRetryPolicy::DefaultRetryPolicy(RetryPolicyConfiguration cfg)
        : cfg_(cfg) {
        if (cfg_.max_attempts == 0) cfg_.max_attempts = 1;
        if (cfg_.backoff_multiplier < 1.0) cfg_.backoff_multiplier = 1.0;
    }

    std::chrono::milliseconds DefaultRetryPolicy::backoff_for(
        std::size_t n) const noexcept {
        if (n == 0 || cfg_.initial_backoff.count() <= 0)
            return std::chrono::milliseconds{0};

        const double base = static_cast<double>(cfg_.initial_backoff.count());
        const double cap = static_cast<double>(cfg_.max_backoff.count());
        const double delay =
            base * std::pow(cfg_.backoff_multiplier,
                            static_cast<double>(n - 1));
        return std::chrono::milliseconds{
            static_cast<std::int64_t>(std::min(delay, std::max(cap, base)))};
    }

    bool DefaultRetryPolicy::is_retryable(const Error& e) const noexcept {
        return root_cause(e).code != Error::Code::PoolClosed;
    }

    std::optional<Error> DefaultRetryPolicy::run(const Attempt& attempt) {
        std::optional<Error> last;

        std::size_t n = 1;
        for (;; ++n) {
            auto err = attempt();
            if (!err) return std::nullopt;

            // Every endpoint has been tried and excluded; the earlier error
            // says why.
            if (last && err->code == Error::Code::NoConnectionAvailable)
                break;

            last = std::move(err);
            if (!is_retryable(*last) || n >= cfg_.max_attempts) break;

            const auto delay = backoff_for(n);
            log::logger()->debug("Attempt {}/{} failed ({}), retrying in {}ms",
                                 n, cfg_.max_attempts, last->message,
                                 delay.count());
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
        }

        log::logger()->warn("Giving up after {} attempt(s): [{}] {}", n,
                            to_string(last->code), last->message);
        return last;
    }

}  // namespace tcp_driver
