#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

#include "../config.hpp"    // ConnectionOptions
#include "../endpoint.hpp"  // Endpoint
#include "../result.hpp"    // Result, Error
#include "connection.hpp"

namespace tcp_driver {

    /// @brief Set the SNI host name on a TLS stream before the handshake.
    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and set the verification mode.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        static_cast<void>(ssl_context.set_verify_mode(
            verify_peer ? boost::asio::ssl::verify_peer
                        : boost::asio::ssl::verify_none));
    }

    /**
     * @brief A blocking TCP (optionally TLS) connection with per-operation
     * timeouts.
     *
     * Each connection drives its own io_context: every operation is started
     * asynchronously on a beast::tcp_stream armed with a deadline and the
     * context is run until that operation completes. A timed out or failed
     * operation closes the connection.
     */
    class TcpConnection final : public Connection {
       private:
        using tcp = boost::asio::ip::tcp;
        using PlainStream = boost::beast::tcp_stream;
        using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // closed
                                    PlainStream, TlsStream>;

        /// Restricts construction to connect().
        struct Passkey {
            explicit Passkey() = default;
        };

       public:
        TcpConnection(Passkey, Endpoint endpoint, ConnectionOptions options)
            : m_endpoint(std::move(endpoint)), m_options(options) {}

        /**
         * @brief Resolve, connect and (when options.tls) handshake.
         * @param endpoint The target endpoint.
         * @param options Timeouts and socket options.
         * @param ssl_ctx TLS context; required when options.tls is set.
         * @return The open connection, or ConnectionFailed / Timeout.
         */
        static Result<std::unique_ptr<TcpConnection>> connect(
            Endpoint endpoint, ConnectionOptions options,
            boost::asio::ssl::context* ssl_ctx = nullptr);

        TcpConnection(const TcpConnection&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;
        TcpConnection(TcpConnection&&) = delete;
        TcpConnection& operator=(TcpConnection&&) = delete;

        ~TcpConnection() noexcept override { close(); }

        const Endpoint& endpoint() const noexcept override {
            return m_endpoint;
        }

        bool is_open() const noexcept override;

        Result<std::size_t> write(std::span<const std::uint8_t> data) override;
        Result<std::size_t> read_some(std::span<std::uint8_t> out) override;
        Result<std::size_t> read_exact(std::span<std::uint8_t> out) override;

        void close() noexcept override;

        /// @brief Whether this connection runs over TLS.
        bool is_tls() const noexcept {
            return std::holds_alternative<TlsStream>(m_stream);
        }

       private:
        boost::system::error_code open_(boost::asio::ssl::context* ssl_ctx);

        template <typename Start>
        Result<std::size_t> run_io_(Start&& start, Error::Code failure,
                                    const char* what);

        /// @brief Run the io_context until done is set.
        void run_until_(bool& done, boost::system::error_code& ec);

        boost::beast::tcp_stream* lowest_layer_() noexcept;

        Error error_from_ec_(const boost::system::error_code& ec,
                             Error::Code failure, const char* what) const;

        boost::asio::io_context m_ioc{1};
        Endpoint m_endpoint{};
        ConnectionOptions m_options{};
        Stream m_stream;
    };

}  // namespace tcp_driver
