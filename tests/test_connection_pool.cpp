
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "tcp_driver/config.hpp"
#include "tcp_driver/connection/keyed_connection_pool.hpp"
#include "tcp_driver/endpoint.hpp"
#include "test_support.hpp"

using namespace tcp_driver;
using namespace std::chrono_literals;
using tcp_driver::testing::FakeConnection;

namespace {

    ConnectionPoolConfiguration default_cfg() {
        ConnectionPoolConfiguration cfg;
        cfg.max_connections_per_endpoint = 2;
        cfg.max_total_connections = 4;
        cfg.connection_idle_ttl = std::chrono::milliseconds(0);
        return cfg;
    }

    Endpoint make_ep(std::string host = "localhost", std::uint16_t port = 80) {
        return Endpoint{std::move(host), port};
    }

    struct CountingFactory {
        std::shared_ptr<std::atomic<int>> created =
            std::make_shared<std::atomic<int>>(0);

        KeyedConnectionPool::ConnectionFactory get() const {
            auto counter = created;
            return [counter](const Endpoint& ep)
                       -> Result<std::unique_ptr<Connection>> {
                counter->fetch_add(1);
                return Result<std::unique_ptr<Connection>>::ok(
                    std::make_unique<FakeConnection>(ep));
            };
        }
    };

    TEST(ConnectionPoolTest, AcquireCreatesAndReusesIdle) {
        CountingFactory factory;
        KeyedConnectionPool pool(default_cfg(), factory.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1);
        EXPECT_EQ(c1.value()->endpoint(), ep);
        pool.release(ep, c1.value());

        auto c2 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c2);
        EXPECT_EQ(c2.value(), c1.value());
        EXPECT_EQ(factory.created->load(), 1);
        EXPECT_EQ(pool.metrics().reused.load(), 1u);
    }

    TEST(ConnectionPoolTest, AcquireRespectsEndpointCapacity) {
        KeyedConnectionPool pool(default_cfg(), CountingFactory{}.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        auto c2 = pool.acquire(ep, 0ms);
        auto c3 = pool.acquire(ep, 0ms);
        EXPECT_TRUE(c1);
        EXPECT_TRUE(c2);
        ASSERT_FALSE(c3);
        EXPECT_EQ(c3.error().code, Error::Code::AcquisitionTimeout);
        EXPECT_EQ(pool.metrics().acquire_timeouts.load(), 1u);
    }

    TEST(ConnectionPoolTest, AcquireRespectsGlobalCapacity) {
        KeyedConnectionPool pool(default_cfg(), CountingFactory{}.get());
        Endpoint a = make_ep("a", 80);
        Endpoint b = make_ep("b", 80);
        Endpoint c = make_ep("c", 80);

        EXPECT_TRUE(pool.acquire(a, 0ms));
        EXPECT_TRUE(pool.acquire(a, 0ms));
        EXPECT_TRUE(pool.acquire(b, 0ms));
        EXPECT_TRUE(pool.acquire(b, 0ms));
        auto r = pool.acquire(c, 0ms);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::AcquisitionTimeout);
        EXPECT_EQ(pool.stats().total_open, 4u);
    }

    TEST(ConnectionPoolTest, IdleConnectionsElsewhereAreEvictedForCapacity) {
        CountingFactory factory;
        KeyedConnectionPool pool(default_cfg(), factory.get());
        Endpoint a = make_ep("a", 80);
        Endpoint b = make_ep("b", 80);
        Endpoint c = make_ep("c", 80);

        auto a1 = pool.acquire(a, 0ms);
        auto a2 = pool.acquire(a, 0ms);
        auto b1 = pool.acquire(b, 0ms);
        auto b2 = pool.acquire(b, 0ms);
        ASSERT_TRUE(a1 && a2 && b1 && b2);
        pool.release(a, a1.value());

        auto c1 = pool.acquire(c, 0ms);
        ASSERT_TRUE(c1);
        EXPECT_EQ(pool.stats().total_open, 4u);
        EXPECT_EQ(pool.stats().total_idle, 0u);
        EXPECT_EQ(pool.metrics().evicted.load(), 1u);
    }

    TEST(ConnectionPoolTest, WaiterWakesWhenConnectionIsReleased) {
        KeyedConnectionPool pool(default_cfg(), CountingFactory{}.get());
        Endpoint ep = make_ep();
        auto c1 = pool.acquire(ep, 0ms);
        auto c2 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1 && c2);

        std::thread releaser([&] {
            std::this_thread::sleep_for(50ms);
            pool.release(ep, c1.value());
        });
        auto c3 = pool.acquire(ep, 2000ms);
        releaser.join();

        ASSERT_TRUE(c3) << c3.error().message;
        EXPECT_EQ(c3.value(), c1.value());
    }

    TEST(ConnectionPoolTest, WaiterTimesOut) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.max_connections_per_endpoint = 1;
        KeyedConnectionPool pool(cfg, CountingFactory{}.get());
        Endpoint ep = make_ep();
        ASSERT_TRUE(pool.acquire(ep, 0ms));

        const auto start = std::chrono::steady_clock::now();
        auto r = pool.acquire(ep, 30ms);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::AcquisitionTimeout);
        EXPECT_GE(elapsed, 30ms);
        EXPECT_EQ(pool.metrics().waiting.load(), 0u);
    }

    TEST(ConnectionPoolTest, FactoryFailureIsReportedAndFreesTheSlot) {
        int calls = 0;
        KeyedConnectionPool pool(
            default_cfg(),
            [&](const Endpoint& ep) -> Result<std::unique_ptr<Connection>> {
                if (++calls == 1) {
                    return Result<std::unique_ptr<Connection>>::err(
                        Error{Error::Code::ConnectionFailed, "refused"});
                }
                return Result<std::unique_ptr<Connection>>::ok(
                    std::make_unique<FakeConnection>(ep));
            });
        Endpoint ep = make_ep();

        auto r = pool.acquire(ep, 0ms);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
        EXPECT_EQ(pool.stats().total_open, 0u);
        EXPECT_EQ(pool.metrics().connect_failures.load(), 1u);

        EXPECT_TRUE(pool.acquire(ep, 0ms));
    }

    TEST(ConnectionPoolTest, ThrowingFactoryBecomesConnectionFailed) {
        KeyedConnectionPool pool(
            default_cfg(),
            [](const Endpoint&) -> Result<std::unique_ptr<Connection>> {
                throw std::runtime_error("resolver exploded");
            });

        auto r = pool.acquire(make_ep(), 0ms);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
        EXPECT_NE(r.error().message.find("resolver exploded"),
                  std::string::npos);
        EXPECT_EQ(pool.stats().total_open, 0u);
    }

    TEST(ConnectionPoolTest, ClosedIdleConnectionIsNotHandedOut) {
        CountingFactory factory;
        KeyedConnectionPool pool(default_cfg(), factory.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1);
        pool.release(ep, c1.value());
        // The peer went away while the connection sat idle.
        c1.value()->close();

        auto c2 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c2);
        EXPECT_TRUE(c2.value()->is_open());
        EXPECT_EQ(factory.created->load(), 2);
        EXPECT_EQ(pool.metrics().dropped_unhealthy.load(), 1u);
    }

    TEST(ConnectionPoolTest, ReleasingClosedConnectionDropsIt) {
        KeyedConnectionPool pool(default_cfg(), CountingFactory{}.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1);
        c1.value()->close();
        pool.release(ep, c1.value());

        EXPECT_EQ(pool.stats().total_open, 0u);
        EXPECT_EQ(pool.stats().total_idle, 0u);
    }

    TEST(ConnectionPoolTest, IdlePruningRemovesExpired) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.connection_idle_ttl = std::chrono::milliseconds(10);
        CountingFactory factory;
        KeyedConnectionPool pool(cfg, factory.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1);
        pool.release(ep, c1.value());
        std::this_thread::sleep_for(std::chrono::milliseconds(30));

        auto c2 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c2);
        EXPECT_EQ(factory.created->load(), 2);
        EXPECT_EQ(pool.metrics().expired_idle.load(), 1u);
    }

    TEST(ConnectionPoolTest, ReuseLimitRetiresConnection) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.max_connection_reuse_count = 2;
        CountingFactory factory;
        KeyedConnectionPool pool(cfg, factory.get());
        Endpoint ep = make_ep();

        for (int i = 0; i < 3; ++i) {
            auto c = pool.acquire(ep, 0ms);
            ASSERT_TRUE(c);
            pool.release(ep, c.value());
        }
        EXPECT_EQ(factory.created->load(), 2);
        EXPECT_EQ(pool.metrics().dropped_worn_out.load(), 1u);
    }

    TEST(ConnectionPoolTest, AgeLimitRetiresConnection) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.max_connection_age = 20ms;
        CountingFactory factory;
        KeyedConnectionPool pool(cfg, factory.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1);
        pool.release(ep, c1.value());

        std::this_thread::sleep_for(50ms);

        auto c2 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c2);
        EXPECT_EQ(factory.created->load(), 2);
        EXPECT_EQ(pool.metrics().dropped_too_old.load(), 1u);
        EXPECT_EQ(pool.stats().total_open, 1u);
        pool.release(ep, c2.value());
    }

    TEST(ConnectionPoolTest, InvalidateFreesCapacity) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.max_connections_per_endpoint = 1;
        CountingFactory factory;
        KeyedConnectionPool pool(cfg, factory.get());
        Endpoint ep = make_ep();

        auto c1 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c1);
        pool.invalidate(ep, c1.value());
        EXPECT_EQ(pool.stats().total_open, 0u);

        auto c2 = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c2);
        EXPECT_EQ(factory.created->load(), 2);
        EXPECT_EQ(pool.metrics().invalidated.load(), 1u);
    }

    TEST(ConnectionPoolTest, UnknownConnectionIsCountedNotAdopted) {
        KeyedConnectionPool pool(default_cfg(), CountingFactory{}.get());
        FakeConnection stranger(make_ep());

        pool.release(make_ep(), &stranger);
        pool.invalidate(make_ep(), &stranger);
        EXPECT_EQ(pool.metrics().foreign_returns.load(), 2u);
        EXPECT_EQ(pool.stats().total_open, 0u);
        EXPECT_TRUE(stranger.is_open());
    }

    TEST(ConnectionPoolTest, CloseFailsAcquiresAndWakesWaiters) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.max_connections_per_endpoint = 1;
        KeyedConnectionPool pool(cfg, CountingFactory{}.get());
        Endpoint ep = make_ep();
        auto held = pool.acquire(ep, 0ms);
        ASSERT_TRUE(held);

        std::thread closer([&] {
            std::this_thread::sleep_for(50ms);
            pool.close();
        });
        auto waiter = pool.acquire(ep, 5000ms);
        closer.join();

        ASSERT_FALSE(waiter);
        EXPECT_EQ(waiter.error().code, Error::Code::PoolClosed);
        EXPECT_TRUE(pool.is_closed());

        // Connections still out are closed when they come back.
        pool.release(ep, held.value());
        EXPECT_EQ(pool.stats().total_open, 0u);

        pool.close();
        auto after = pool.acquire(ep, 0ms);
        ASSERT_FALSE(after);
        EXPECT_EQ(after.error().code, Error::Code::PoolClosed);
    }

    TEST(ConnectionPoolTest, CloseClosesIdleConnections) {
        KeyedConnectionPool pool(default_cfg(), CountingFactory{}.get());
        Endpoint ep = make_ep();
        auto c = pool.acquire(ep, 0ms);
        ASSERT_TRUE(c);
        pool.release(ep, c.value());
        EXPECT_EQ(pool.stats().total_idle, 1u);

        pool.close();
        EXPECT_EQ(pool.stats().total_idle, 0u);
        EXPECT_EQ(pool.stats().total_open, 0u);
    }

    TEST(ConnectionPoolTest, FactoryIsRequired) {
        EXPECT_THROW(KeyedConnectionPool(default_cfg(), nullptr),
                     std::invalid_argument);
    }

    TEST(ConnectionPoolTest, ConcurrentBorrowersNeverExceedLimits) {
        ConnectionPoolConfiguration cfg = default_cfg();
        cfg.max_total_connections = 3;
        cfg.max_connections_per_endpoint = 2;
        CountingFactory factory;
        KeyedConnectionPool pool(cfg, factory.get());
        const std::vector<Endpoint> eps{make_ep("a", 1), make_ep("b", 2)};

        std::atomic<int> ok{0};
        std::atomic<int> in_use{0};
        std::atomic<int> max_in_use{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < 200; ++i) {
                    const Endpoint& ep = eps[(t + i) % eps.size()];
                    auto c = pool.acquire(ep, 2000ms);
                    if (!c) continue;
                    const int now = in_use.fetch_add(1) + 1;
                    int prev = max_in_use.load();
                    while (now > prev &&
                           !max_in_use.compare_exchange_weak(prev, now)) {
                    }
                    in_use.fetch_sub(1);
                    if (i % 7 == 0)
                        pool.invalidate(ep, c.value());
                    else
                        pool.release(ep, c.value());
                    ok.fetch_add(1);
                }
            });
        }
        for (auto& th : threads) th.join();

        EXPECT_EQ(ok.load(), 8 * 200);
        EXPECT_LE(max_in_use.load(), 3);
        auto stats = pool.stats();
        EXPECT_EQ(stats.total_in_use, 0u);
        EXPECT_LE(stats.total_open, 3u);
        EXPECT_EQ(pool.metrics().acquired.load(), 8u * 200u);
    }

}  // namespace
