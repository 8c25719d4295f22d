#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "tcp_driver/driver.hpp"
#include "tcp_driver/stream.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_ms = total_ms / iters;
    const double min_ms =
        std::chrono::duration<double, std::milli>(min).count();
    const double max_ms =
        std::chrono::duration<double, std::milli>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << std::fixed
              << std::setprecision(3) << " total_ms=" << total_ms
              << " avg_ms=" << avg_ms << " min_ms=" << min_ms
              << " max_ms=" << max_ms << "\n";
}

static void print_rps(const char* label, int seconds, std::uint64_t total_sends,
                      const std::vector<std::uint32_t>& per_sec) {
    std::uint32_t peak = 0;
    for (auto v : per_sec) peak = std::max(peak, v);

    const double avg =
        seconds > 0 ? (double)total_sends / (double)seconds : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        duration_s=" << seconds
              << " total_sends=" << total_sends << " avg_sps=" << std::fixed
              << std::setprecision(2) << avg << " peak_sps=" << peak << "\n";
}

// In-process echo server; every accepted socket gets its own thread.
class LocalEchoServer {
   public:
    LocalEchoServer() : ioc_(1), acceptor_(ioc_) {}

    void start() {
        boost::system::error_code ec;

        tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};

        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("acceptor.open: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::runtime_error("acceptor.set_option: " + ec.message());

        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());

        port_ = acceptor_.local_endpoint().port();

        do_accept();
        thread_ = std::thread([this] { ioc_.run(); });
    }

    void stop() {
        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true)) {
            return;
        }

        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
    }

    ~LocalEchoServer() { stop(); }

    std::uint16_t port() const { return port_; }

   private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [this](boost::system::error_code ec, tcp::socket sock) {
                if (!ec) {
                    std::thread(&LocalEchoServer::handle_connection,
                                std::move(sock))
                        .detach();
                }
                if (!stopped_.load(std::memory_order_relaxed)) {
                    do_accept();
                }
            });
    }

    static void handle_connection(tcp::socket sock) {
        std::array<char, 8192> buf{};
        for (;;) {
            boost::system::error_code ec;
            const std::size_t n = sock.read_some(net::buffer(buf), ec);
            if (ec) break;
            net::write(sock, net::buffer(buf.data(), n), ec);
            if (ec) break;
        }

        boost::system::error_code ignored;
        sock.shutdown(tcp::socket::shutdown_send, ignored);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> stopped_{false};
    std::uint16_t port_{0};
};

namespace {

    tcp_driver::Result<std::string> ping(tcp_driver::Connection& c) {
        auto w = tcp_driver::stream::write_string(c, "ping");
        if (!w) return tcp_driver::Result<std::string>::err(w.error());
        return tcp_driver::stream::read_string(c);
    }

    /// A loopback port nobody listens on.
    tcp_driver::Endpoint dead_endpoint() {
        net::io_context ioc;
        tcp::acceptor a(ioc,
                        tcp::endpoint{net::ip::make_address("127.0.0.1"), 0});
        const auto port = a.local_endpoint().port();
        a.close();
        return tcp_driver::Endpoint{"127.0.0.1", port};
    }

}  // namespace

class DriverPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() {
        server_.start();
        cfg_.hosts = {tcp_driver::Endpoint{"127.0.0.1", server_.port()}};
        cfg_.pool.max_total_connections = 64;
        cfg_.pool.max_connections_per_endpoint = 64;
    }

    static void TearDownTestSuite() { server_.stop(); }

    static inline LocalEchoServer server_{};
    static inline tcp_driver::DriverConfiguration cfg_{};
};

TEST_F(DriverPerf, WarmSameDriver) {
    constexpr int iters = 2000;
    tcp_driver::Driver driver(cfg_);

    {
        auto r = driver.send(ping);
        ASSERT_TRUE(r) << r.error().message;
    }

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto r = driver.send(ping);
        const auto t1 = clock::now();

        ASSERT_TRUE(r) << r.error().message;
        ASSERT_EQ(r.value(), "ping");

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Warm (same driver -> local echo)", iters, total, min, max);
}

TEST_F(DriverPerf, ColdNewDriverEachSend) {
    constexpr int iters = 200;
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        tcp_driver::Driver driver(cfg_);

        const auto t0 = clock::now();
        auto r = driver.send(ping);
        const auto t1 = clock::now();

        ASSERT_TRUE(r) << r.error().message;

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Cold (new driver each send -> local echo)", iters, total,
                 min, max);
}

TEST_F(DriverPerf, FirstSendWithDeadHost) {
    constexpr int iters = 100;
    using clock = std::chrono::steady_clock;

    auto cfg = cfg_;
    cfg.hosts.insert(cfg.hosts.begin(), dead_endpoint());

    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        tcp_driver::Driver driver(cfg);

        const auto t0 = clock::now();
        auto r = driver.send(ping);
        const auto t1 = clock::now();

        ASSERT_TRUE(r) << r.error().message;

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Failover (1 dead + 1 live host, new driver each send)",
                 iters, total, min, max);
}

TEST_F(DriverPerf, MaxSendsPerSecond) {
    constexpr int seconds = 5;
    tcp_driver::Driver driver(cfg_);

    {
        auto r = driver.send(ping);
        ASSERT_TRUE(r) << r.error().message;
    }

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    std::vector<std::uint32_t> per_sec(seconds, 0);
    std::uint64_t total = 0;

    for (;;) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                                 clock::now() - start)
                                 .count();
        if (elapsed >= seconds) break;

        auto r = driver.send(ping);
        ASSERT_TRUE(r) << r.error().message;

        ++total;
        ++per_sec[static_cast<std::size_t>(elapsed)];
    }

    print_rps("Max sends/s (same driver -> local echo)", seconds, total,
              per_sec);
}

TEST_F(DriverPerf, ConcurrentSenders) {
    constexpr int threads = 8;
    constexpr int iters_per_thread = 1000;
    tcp_driver::Driver driver(cfg_);

    std::atomic<int> failures{0};
    const auto t0 = std::chrono::steady_clock::now();

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < iters_per_thread; ++i) {
                if (!driver.send(ping)) failures.fetch_add(1);
            }
        });
    }
    for (auto& w : workers) w.join();

    const auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_EQ(failures.load(), 0);

    const double ms =
        std::chrono::duration<double, std::milli>(elapsed).count();
    std::cout << "\n[ PERF ] Concurrent (" << threads
              << " threads, same driver -> local echo)\n"
              << "        sends=" << threads * iters_per_thread << std::fixed
              << std::setprecision(2) << " total_ms=" << ms
              << " sends_per_s=" << (threads * iters_per_thread) / (ms / 1000.0)
              << "\n";
}
