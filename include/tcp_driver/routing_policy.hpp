#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

#include "tcp_driver/config.hpp"
#include "tcp_driver/endpoint.hpp"
#include "tcp_driver/error.hpp"

namespace tcp_driver {

    /**
     * @brief Decides which endpoint each attempt goes to.
     *
     * Implementations own the set of candidate endpoints and a blacklist.
     * Every method may be called concurrently from any number of threads.
     */
    class RoutingPolicy {
       public:
        virtual ~RoutingPolicy() = default;

        /// @brief Pick an endpoint that is not blacklisted.
        /// @return std::nullopt when no host is configured or all are
        /// blacklisted.
        [[nodiscard]] virtual std::optional<Endpoint> select_host() = 0;

        virtual void add_host(const Endpoint& ep) = 0;
        virtual void remove_host(const Endpoint& ep) = 0;

        /// @brief Exclude an endpoint from selection.
        virtual void blacklist(const Endpoint& ep) = 0;

        /// @brief Make a blacklisted endpoint selectable again.
        virtual void unblacklist(const Endpoint& ep) = 0;

        /// @brief Called after every failed attempt against ep, after the
        /// endpoint has been blacklisted.
        virtual void on_error(const Endpoint& ep, const Error& cause) {
            (void)ep;
            (void)cause;
        }

        [[nodiscard]] virtual bool is_blacklisted(const Endpoint& ep) const = 0;

        /// @brief All known endpoints, blacklisted ones included.
        [[nodiscard]] virtual std::vector<Endpoint> hosts() const = 0;
    };

    /**
     * @brief Immutable snapshot of the routing state.
     *
     * The blacklist maps an endpoint to the instant its exclusion ends;
     * time_point::max() means "until explicitly removed".
     */
    struct RoutingState {
        using clock_type = std::chrono::steady_clock;

        std::vector<Endpoint> hosts;
        std::unordered_map<Endpoint, clock_type::time_point> blacklist;

        bool is_blacklisted(const Endpoint& ep,
                            clock_type::time_point now) const {
            auto it = blacklist.find(ep);
            return it != blacklist.end() && now < it->second;
        }
    };

    /**
     * @brief Random selection among non-blacklisted hosts.
     *
     * CONCURRENCY: the state is an immutable RoutingState published through
     * an atomic shared_ptr. Readers load a snapshot without locking; writers
     * copy the current snapshot, modify the copy and publish it with
     * compare-and-swap, retrying the whole cycle when another writer won.
     */
    class DefaultRoutingPolicy : public RoutingPolicy {
       public:
        explicit DefaultRoutingPolicy(std::vector<Endpoint> hosts,
                                      RoutingPolicyConfiguration cfg = {});

        DefaultRoutingPolicy(const DefaultRoutingPolicy&) = delete;
        DefaultRoutingPolicy& operator=(const DefaultRoutingPolicy&) = delete;

        std::optional<Endpoint> select_host() override;
        void add_host(const Endpoint& ep) override;
        void remove_host(const Endpoint& ep) override;
        void blacklist(const Endpoint& ep) override;
        void unblacklist(const Endpoint& ep) override;
        bool is_blacklisted(const Endpoint& ep) const override;
        std::vector<Endpoint> hosts() const override;

        /// @brief Current routing state (never null).
        std::shared_ptr<const RoutingState> snapshot() const noexcept;

        const RoutingPolicyConfiguration& config() const noexcept {
            return cfg_;
        }

       private:
        /// @brief Read-copy-CAS loop; fn edits the copy and returns false to
        /// abandon the update.
        template <typename Fn>
        void update_(Fn&& fn);

        RoutingPolicyConfiguration cfg_;
        std::shared_ptr<const RoutingState> state_;  ///< Accessed atomically

        std::mutex rng_mu_;  ///< Guards rng_
        std::mt19937_64 rng_;
    };

}  // namespace tcp_driver
