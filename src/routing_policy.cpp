// Routing state is published RCU-style: readers atomic_load a snapshot with
// ACQUIRE, writers copy it, edit the copy and compare-exchange it back in.
// A writer that loses the race reloads and recomputes, so concurrent
// add/remove/blacklist calls never overwrite each other.

#include "tcp_driver/routing_policy.hpp"

#include <algorithm>
#include <atomic>

#include "tcp_driver/log.hpp"

namespace tcp_driver {

    namespace {
        std::vector<Endpoint> unique_hosts(std::vector<Endpoint> hosts) {
            std::vector<Endpoint> out;
            out.reserve(hosts.size());
            for (auto& ep : hosts) {
                if (std::find(out.begin(), out.end(), ep) == out.end())
                    out.push_back(std::move(ep));
            }
            return out;
        }
    }  // namespace

    DefaultRoutingPolicy::DefaultRoutingPolicy(std::vector<Endpoint> hosts,
                                               RoutingPolicyConfiguration cfg)
        : cfg_(cfg) {
        auto initial = std::make_shared<RoutingState>();
        initial->hosts = unique_hosts(std::move(hosts));
        state_ = std::move(initial);

        if (cfg_.seed) {
            rng_.seed(*cfg_.seed);
        } else {
            std::random_device rd;
            rng_.seed((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
        }
    }

    std::shared_ptr<const RoutingState> DefaultRoutingPolicy::snapshot()
        const noexcept {
        return std::atomic_load_explicit(&state_, std::memory_order_acquire);
    }

    template <typename Fn>
    void DefaultRoutingPolicy::update_(Fn&& fn) {
        auto cur = snapshot();
        for (;;) {
            auto next = std::make_shared<RoutingState>(*cur);
            if (!fn(*next)) return;

            // Drop expired blacklist entries while we hold a private copy.
            const auto now = RoutingState::clock_type::now();
            for (auto it = next->blacklist.begin();
                 it != next->blacklist.end();) {
                if (it->second <= now)
                    it = next->blacklist.erase(it);
                else
                    ++it;
            }

            std::shared_ptr<const RoutingState> cnext = std::move(next);
            if (std::atomic_compare_exchange_weak_explicit(
                    &state_, &cur, std::move(cnext), std::memory_order_acq_rel,
                    std::memory_order_acquire)) {
                return;
            }
            // cur now holds the winner's snapshot; recompute from it.
        }
    }

    std::optional<Endpoint> DefaultRoutingPolicy::select_host() {
        auto snap = snapshot();
        const auto now = RoutingState::clock_type::now();

        std::vector<const Endpoint*> candidates;
        candidates.reserve(snap->hosts.size());
        for (auto const& ep : snap->hosts) {
            if (!snap->is_blacklisted(ep, now)) candidates.push_back(&ep);
        }
        if (candidates.empty()) return std::nullopt;

        std::size_t idx = 0;
        {
            std::lock_guard<std::mutex> lk(rng_mu_);
            std::uniform_int_distribution<std::size_t> dist(
                0, candidates.size() - 1);
            idx = dist(rng_);
        }
        return *candidates[idx];
    }

    void DefaultRoutingPolicy::add_host(const Endpoint& ep) {
        bool added = false;
        update_([&](RoutingState& s) {
            added = std::find(s.hosts.begin(), s.hosts.end(), ep) ==
                    s.hosts.end();
            if (added) s.hosts.push_back(ep);
            return added;
        });
        if (added) log::logger()->info("Added host {}", to_string(ep));
    }

    void DefaultRoutingPolicy::remove_host(const Endpoint& ep) {
        bool removed = false;
        update_([&](RoutingState& s) {
            auto it = std::find(s.hosts.begin(), s.hosts.end(), ep);
            removed = it != s.hosts.end();
            if (removed) s.hosts.erase(it);
            return removed;
        });
        if (removed) log::logger()->info("Removed host {}", to_string(ep));
    }

    void DefaultRoutingPolicy::blacklist(const Endpoint& ep) {
        const auto until =
            cfg_.blacklist_ttl.count() > 0
                ? RoutingState::clock_type::now() + cfg_.blacklist_ttl
                : RoutingState::clock_type::time_point::max();
        update_([&](RoutingState& s) {
            s.blacklist[ep] = until;
            return true;
        });
    }

    void DefaultRoutingPolicy::unblacklist(const Endpoint& ep) {
        update_([&](RoutingState& s) { return s.blacklist.erase(ep) > 0; });
    }

    bool DefaultRoutingPolicy::is_blacklisted(const Endpoint& ep) const {
        return snapshot()->is_blacklisted(ep,
                                          RoutingState::clock_type::now());
    }

    std::vector<Endpoint> DefaultRoutingPolicy::hosts() const {
        return snapshot()->hosts;
    }

}  // namespace tcp_driver
