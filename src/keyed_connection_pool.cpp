#include "tcp_driver/connection/keyed_connection_pool.hpp"

#include <algorithm>
#include <cassert>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "tcp_driver/connection/tcp_connection.hpp"
#include "tcp_driver/log.hpp"

namespace tcp_driver {

    namespace {
        KeyedConnectionPool::ConnectionFactory make_tcp_factory(
            ConnectionOptions options, boost::asio::ssl::context* ssl_ctx) {
            return [options, ssl_ctx](const Endpoint& ep)
                       -> Result<std::unique_ptr<Connection>> {
                auto conn = TcpConnection::connect(ep, options, ssl_ctx);
                if (!conn) {
                    return Result<std::unique_ptr<Connection>>::err(
                        std::move(conn).error());
                }
                return Result<std::unique_ptr<Connection>>::ok(
                    std::move(conn).value());
            };
        }
    }  // namespace

    KeyedConnectionPool::KeyedConnectionPool(ConnectionPoolConfiguration cfg)
        : cfg_(std::move(cfg)) {
        if (cfg_.connection.tls) {
            ssl_ctx_ = std::make_unique<boost::asio::ssl::context>(
                boost::asio::ssl::context::tls_client);
            init_tls_on_ssl_context(*ssl_ctx_, cfg_.connection.verify_tls);
        }
        factory_ = make_tcp_factory(cfg_.connection, ssl_ctx_.get());
    }

    KeyedConnectionPool::KeyedConnectionPool(ConnectionPoolConfiguration cfg,
                                             ConnectionFactory factory)
        : cfg_(std::move(cfg)), factory_(std::move(factory)) {
        if (!factory_) {
            throw std::invalid_argument(
                "KeyedConnectionPool requires a connection factory");
        }
    }

    KeyedConnectionPool::~KeyedConnectionPool() { close(); }

    Result<Connection*> KeyedConnectionPool::acquire(
        const Endpoint& ep, std::chrono::milliseconds timeout) {
        using R = Result<Connection*>;

        const auto deadline =
            clock_type::now() + std::max(timeout, std::chrono::milliseconds{0});

        std::unique_lock<std::mutex> lk(mu_);
        for (;;) {
            if (closed_) {
                metrics_.rejected_closed.fetch_add(1, std::memory_order_relaxed);
                return R::err(
                    Error{Error::Code::PoolClosed, "Connection pool is closed"});
            }

            const auto now = clock_type::now();
            prune_idle_locked_(now);

            Bucket& b = buckets_[ep];
            if (Connection* conn = take_idle_locked_(b, now)) {
                metrics_.acquired.fetch_add(1,
                                                   std::memory_order_relaxed);
                publish_gauges_locked_();
                check_invariants_locked_();
                return R::ok(conn);
            }

            const bool endpoint_room =
                b.open() < cfg_.max_connections_per_endpoint;
            if (endpoint_room && total_open_ >= cfg_.max_total_connections) {
                // Capacity is parked on other endpoints; reclaim some.
                evict_idle_locked_(&b);
            }
            if (endpoint_room && total_open_ < cfg_.max_total_connections) {
                return open_locked_(lk, ep, b);
            }

            if (now >= deadline) {
                metrics_.acquire_timeouts.fetch_add(1,
                                                   std::memory_order_relaxed);
                log::logger()->debug(
                    "Timed out acquiring connection to {} ({} open)",
                    to_string(ep), total_open_);
                return R::err(Error{Error::Code::AcquisitionTimeout,
                                    "Timed out acquiring a connection to " +
                                        to_string(ep)});
            }

            metrics_.waiting.fetch_add(1, std::memory_order_relaxed);
            cv_.wait_until(lk, deadline);
            metrics_.waiting.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    Result<Connection*> KeyedConnectionPool::open_locked_(
        std::unique_lock<std::mutex>& lk, const Endpoint& ep, Bucket& b) {
        using R = Result<Connection*>;

        // Reserve the slot, then connect without holding the lock.
        ++b.connecting;
        ++total_open_;
        lk.unlock();

        auto created = [&]() -> Result<std::unique_ptr<Connection>> {
            try {
                return factory_(ep);
            } catch (const std::exception& e) {
                return Result<std::unique_ptr<Connection>>::err(
                    Error{Error::Code::ConnectionFailed,
                          "Failed to connect to " + to_string(ep) + ": " +
                              e.what()});
            }
        }();

        lk.lock();
        --b.connecting;

        if (!created || !created.value()) {
            --total_open_;
            metrics_.connect_failures.fetch_add(1, std::memory_order_relaxed);
            cv_.notify_all();
            check_invariants_locked_();

            Error e = created ? Error{Error::Code::ConnectionFailed,
                                      "Factory returned no connection for " +
                                          to_string(ep)}
                              : std::move(created).error();
            log::logger()->debug("Could not open connection to {}: {}",
                                 to_string(ep), e.message);
            return R::err(std::move(e));
        }

        if (closed_) {
            --total_open_;
            metrics_.rejected_closed.fetch_add(1, std::memory_order_relaxed);
            created.value()->close();
            return R::err(
                Error{Error::Code::PoolClosed, "Connection pool is closed"});
        }

        Connection* raw = created.value().get();
        b.in_use.emplace(
            raw, InUseEntry{std::move(created).value(), clock_type::now(), 1});
        ++total_in_use_;

        metrics_.opened.fetch_add(1, std::memory_order_relaxed);
        metrics_.acquired.fetch_add(1, std::memory_order_relaxed);
        publish_gauges_locked_();
        check_invariants_locked_();

        log::logger()->debug("Opened connection to {} ({} open)", to_string(ep),
                             total_open_);
        return R::ok(raw);
    }

    Connection* KeyedConnectionPool::take_idle_locked_(
        Bucket& b, clock_type::time_point now) {
        // Most recently returned first; the oldest ones are left to expire.
        while (!b.idle.empty()) {
            IdleEntry entry = std::move(b.idle.back());
            b.idle.pop_back();
            --total_idle_;

            bool drop = false;
            if (!entry.conn ||
                (cfg_.test_on_borrow && !entry.conn->is_open())) {
                metrics_.dropped_unhealthy.fetch_add(
                    1, std::memory_order_relaxed);
                drop = true;
            } else if (cfg_.max_connection_reuse_count > 0 &&
                       entry.reuse_count >= cfg_.max_connection_reuse_count) {
                metrics_.dropped_worn_out.fetch_add(
                    1, std::memory_order_relaxed);
                drop = true;
            } else if (cfg_.max_connection_age.count() > 0 &&
                       now - entry.created >= cfg_.max_connection_age) {
                metrics_.dropped_too_old.fetch_add(
                    1, std::memory_order_relaxed);
                drop = true;
            }

            if (drop) {
                --total_open_;
                if (entry.conn) entry.conn->close();
                continue;
            }

            Connection* raw = entry.conn.get();
            b.in_use.emplace(raw,
                             InUseEntry{std::move(entry.conn), entry.created,
                                        entry.reuse_count + 1});
            ++total_in_use_;
            metrics_.reused.fetch_add(1, std::memory_order_relaxed);
            return raw;
        }
        return nullptr;
    }

    void KeyedConnectionPool::prune_idle_locked_(clock_type::time_point now) {
        if (cfg_.connection_idle_ttl.count() <= 0) return;

        for (auto& [ep, b] : buckets_) {
            // Front is the least recently returned.
            while (!b.idle.empty() &&
                   now - b.idle.front().last_used > cfg_.connection_idle_ttl) {
                auto entry = std::move(b.idle.front());
                b.idle.pop_front();
                --total_idle_;
                --total_open_;
                if (entry.conn) entry.conn->close();
                metrics_.expired_idle.fetch_add(1, std::memory_order_relaxed);
                log::logger()->debug("Pruned idle connection to {}",
                                     to_string(ep));
            }
        }
    }

    bool KeyedConnectionPool::evict_idle_locked_(Bucket const* keep) {
        Bucket* victim = nullptr;
        auto oldest = clock_type::time_point::max();

        for (auto& [ep, b] : buckets_) {
            (void)ep;
            if (&b == keep || b.idle.empty()) continue;
            if (b.idle.front().last_used < oldest) {
                oldest = b.idle.front().last_used;
                victim = &b;
            }
        }
        if (victim == nullptr) return false;

        auto entry = std::move(victim->idle.front());
        victim->idle.pop_front();
        --total_idle_;
        --total_open_;
        if (entry.conn) entry.conn->close();
        metrics_.evicted.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    KeyedConnectionPool::InUseEntry KeyedConnectionPool::take_in_use_locked_(
        const Endpoint& ep, Connection* conn) {
        auto bit = buckets_.find(ep);
        if (bit == buckets_.end()) return InUseEntry{};

        auto it = bit->second.in_use.find(conn);
        if (it == bit->second.in_use.end()) return InUseEntry{};

        InUseEntry entry = std::move(it->second);
        bit->second.in_use.erase(it);
        --total_in_use_;
        return entry;
    }

    void KeyedConnectionPool::release(const Endpoint& ep, Connection* conn) {
        std::unique_ptr<Connection> doomed;
        {
            std::lock_guard<std::mutex> lk(mu_);

            InUseEntry entry = take_in_use_locked_(ep, conn);
            if (!entry.conn) {
                metrics_.foreign_returns.fetch_add(1,
                                                   std::memory_order_relaxed);
                log::logger()->warn(
                    "Released a connection to {} the pool does not own",
                    to_string(ep));
                return;
            }

            if (closed_ || !entry.conn->is_open()) {
                if (!closed_) {
                    metrics_.dropped_unhealthy.fetch_add(
                        1, std::memory_order_relaxed);
                }
                --total_open_;
                doomed = std::move(entry.conn);
            } else {
                buckets_[ep].idle.push_back(
                    IdleEntry{std::move(entry.conn), clock_type::now(),
                              entry.created, entry.reuse_count});
                ++total_idle_;
            }

            metrics_.released.fetch_add(1, std::memory_order_relaxed);
            publish_gauges_locked_();
            check_invariants_locked_();
        }
        cv_.notify_all();

        if (doomed) doomed->close();
    }

    void KeyedConnectionPool::invalidate(const Endpoint& ep, Connection* conn) {
        std::unique_ptr<Connection> doomed;
        {
            std::lock_guard<std::mutex> lk(mu_);

            InUseEntry entry = take_in_use_locked_(ep, conn);
            if (!entry.conn) {
                metrics_.foreign_returns.fetch_add(1,
                                                   std::memory_order_relaxed);
                log::logger()->warn(
                    "Invalidated a connection to {} the pool does not own",
                    to_string(ep));
                return;
            }

            --total_open_;
            doomed = std::move(entry.conn);

            metrics_.invalidated.fetch_add(1, std::memory_order_relaxed);
            publish_gauges_locked_();
            check_invariants_locked_();
        }
        cv_.notify_all();

        doomed->close();
        log::logger()->debug("Invalidated connection to {}", to_string(ep));
    }

    void KeyedConnectionPool::close() {
        std::vector<std::unique_ptr<Connection>> doomed;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            closed_ = true;

            for (auto& [ep, b] : buckets_) {
                (void)ep;
                while (!b.idle.empty()) {
                    doomed.push_back(std::move(b.idle.front().conn));
                    b.idle.pop_front();
                    --total_open_;
                }
            }
            total_idle_ = 0;
            publish_gauges_locked_();
            check_invariants_locked_();
        }
        cv_.notify_all();

        for (auto& conn : doomed) {
            if (conn) conn->close();
        }
        log::logger()->debug("Connection pool closed ({} idle closed)",
                             doomed.size());
    }

    KeyedConnectionPool::Stats KeyedConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        return Stats{total_open_, total_idle_, total_in_use_};
    }

    bool KeyedConnectionPool::is_closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    void KeyedConnectionPool::publish_gauges_locked_() {
        metrics_.in_use.store(total_in_use_, std::memory_order_relaxed);
        metrics_.idle.store(total_idle_, std::memory_order_relaxed);
    }

    void KeyedConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::size_t open = 0;
        std::size_t idle = 0;
        std::size_t in_use = 0;
        for (auto const& [ep, b] : buckets_) {
            (void)ep;
            assert(b.open() <= cfg_.max_connections_per_endpoint);
            open += b.open();
            idle += b.idle.size();
            in_use += b.in_use.size();
        }
        assert(open == total_open_);
        assert(idle == total_idle_);
        assert(in_use == total_in_use_);
        assert(total_open_ <= cfg_.max_total_connections);
#endif
    }

}  // namespace tcp_driver
