#include "tcp_driver/connection/tcp_connection.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>

#include "tcp_driver/log.hpp"

namespace tcp_driver {

    namespace {
        void arm(boost::beast::tcp_stream& s,
                 std::chrono::milliseconds timeout) {
            if (timeout.count() > 0)
                s.expires_after(timeout);
            else
                s.expires_never();
        }
    }  // namespace

    Result<std::unique_ptr<TcpConnection>> TcpConnection::connect(
        Endpoint endpoint, ConnectionOptions options,
        boost::asio::ssl::context* ssl_ctx) {
        using R = Result<std::unique_ptr<TcpConnection>>;

        if (options.tls && ssl_ctx == nullptr) {
            return R::err(Error{Error::Code::InvalidArgument,
                                "TLS requested without an SSL context"});
        }

        auto conn = std::make_unique<TcpConnection>(
            Passkey{}, std::move(endpoint), options);

        auto ec = conn->open_(ssl_ctx);
        if (ec) {
            return R::err(conn->error_from_ec_(
                ec, Error::Code::ConnectionFailed, "Failed to connect to"));
        }
        return R::ok(std::move(conn));
    }

    boost::system::error_code TcpConnection::open_(
        boost::asio::ssl::context* ssl_ctx) {
        boost::system::error_code ec;

        tcp::resolver resolver(m_ioc);
        auto results = resolver.resolve(m_endpoint.host,
                                        std::to_string(m_endpoint.port), ec);
        if (ec) return ec;

        if (m_options.tls) {
            m_stream.emplace<TlsStream>(m_ioc, *ssl_ctx);
        } else {
            m_stream.emplace<PlainStream>(m_ioc);
        }

        auto* lowest = lowest_layer_();
        arm(*lowest, m_options.connect_timeout);

        bool done = false;
        lowest->async_connect(
            results, [&](boost::system::error_code e, tcp::endpoint) {
                ec = e;
                done = true;
            });
        run_until_(done, ec);
        if (ec) {
            close();
            return ec;
        }

        boost::system::error_code opt_ec;
        static_cast<void>(lowest->socket().set_option(
            tcp::no_delay(m_options.tcp_no_delay), opt_ec));
        if (!opt_ec) {
            static_cast<void>(lowest->socket().set_option(
                boost::asio::socket_base::keep_alive(m_options.keep_alive),
                opt_ec));
        }
        if (opt_ec) {
            log::logger()->debug("Could not set socket options on {}: {}",
                                 to_string(m_endpoint), opt_ec.message());
        }

        if (auto* tls = std::get_if<TlsStream>(&m_stream)) {
            if (!set_sni(*tls, m_endpoint.host, ec)) {
                close();
                return ec;
            }
            if (m_options.verify_tls) {
                tls->set_verify_callback(
                    boost::asio::ssl::host_name_verification(m_endpoint.host));
            }

            arm(*lowest, m_options.connect_timeout);
            done = false;
            tls->async_handshake(boost::asio::ssl::stream_base::client,
                                 [&](boost::system::error_code e) {
                                     ec = e;
                                     done = true;
                                 });
            run_until_(done, ec);
            if (ec) {
                close();
                return ec;
            }
        }

        lowest->expires_never();
        return ec;
    }

    void TcpConnection::run_until_(bool& done, boost::system::error_code& ec) {
        m_ioc.restart();
        while (!done) {
            if (m_ioc.run_one() == 0) break;
        }
        if (!done) ec = boost::asio::error::operation_aborted;
    }

    boost::beast::tcp_stream* TcpConnection::lowest_layer_() noexcept {
        if (auto* s = std::get_if<PlainStream>(&m_stream)) return s;
        if (auto* s = std::get_if<TlsStream>(&m_stream))
            return &boost::beast::get_lowest_layer(*s);
        return nullptr;
    }

    bool TcpConnection::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return false;
                } else if constexpr (std::is_same_v<T, PlainStream>) {
                    return s.socket().is_open();
                } else {  // TlsStream
                    return boost::beast::get_lowest_layer(s).socket().is_open();
                }
            },
            m_stream);
    }

    void TcpConnection::close() noexcept {
        boost::system::error_code ec;

        if (auto* lowest = lowest_layer_()) {
            // No TLS close_notify; just drop the TCP connection.
            static_cast<void>(
                lowest->socket().shutdown(tcp::socket::shutdown_both, ec));
            static_cast<void>(lowest->socket().close(ec));
        }
        m_stream.emplace<std::monostate>();
    }

    Error TcpConnection::error_from_ec_(const boost::system::error_code& ec,
                                        Error::Code failure,
                                        const char* what) const {
        Error e{};
        e.code = (ec == boost::beast::error::timeout) ? Error::Code::Timeout
                                                      : failure;
        e.message =
            std::string(what) + " " + to_string(m_endpoint) + ": " + ec.message();
        return e;
    }

    template <typename Start>
    Result<std::size_t> TcpConnection::run_io_(Start&& start,
                                               Error::Code failure,
                                               const char* what) {
        auto* lowest = lowest_layer_();
        if (lowest == nullptr || !is_open()) {
            return Result<std::size_t>::err(
                Error{Error::Code::ConnectionClosed,
                      "Connection to " + to_string(m_endpoint) + " is closed"});
        }

        boost::system::error_code ec;
        std::size_t transferred = 0;
        bool done = false;
        auto handler = [&](boost::system::error_code e, std::size_t n) {
            ec = e;
            transferred = n;
            done = true;
        };

        arm(*lowest, m_options.io_timeout);
        if (auto* plain = std::get_if<PlainStream>(&m_stream)) {
            start(*plain, handler);
        } else {
            start(std::get<TlsStream>(m_stream), handler);
        }
        run_until_(done, ec);

        if (ec) {
            auto e = error_from_ec_(ec, failure, what);
            close();
            return Result<std::size_t>::err(std::move(e));
        }
        return Result<std::size_t>::ok(transferred);
    }

    Result<std::size_t> TcpConnection::write(
        std::span<const std::uint8_t> data) {
        return run_io_(
            [&](auto& stream, auto handler) {
                boost::asio::async_write(
                    stream, boost::asio::buffer(data.data(), data.size()),
                    std::move(handler));
            },
            Error::Code::WriteFailed, "Failed to write to");
    }

    Result<std::size_t> TcpConnection::read_some(std::span<std::uint8_t> out) {
        return run_io_(
            [&](auto& stream, auto handler) {
                stream.async_read_some(
                    boost::asio::buffer(out.data(), out.size()),
                    std::move(handler));
            },
            Error::Code::ReadFailed, "Failed to read from");
    }

    Result<std::size_t> TcpConnection::read_exact(std::span<std::uint8_t> out) {
        return run_io_(
            [&](auto& stream, auto handler) {
                boost::asio::async_read(
                    stream, boost::asio::buffer(out.data(), out.size()),
                    std::move(handler));
            },
            Error::Code::ReadFailed, "Failed to read from");
    }

}  // namespace tcp_driver
