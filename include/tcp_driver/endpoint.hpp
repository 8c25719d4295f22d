#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace tcp_driver {

    /// @brief One server instance among several equivalent alternatives.
    /// @note Used as the pool key, the routing key and the blacklist key.
    struct Endpoint {
        std::string host;
        std::uint16_t port{0};

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.port == b.port && a.host == b.host;
        }

        friend bool operator!=(Endpoint const& a, Endpoint const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief Render an endpoint as "host:port" (IPv6 hosts in brackets).
    inline std::string to_string(Endpoint const& ep) {
        if (ep.host.find(':') != std::string::npos) {
            return "[" + ep.host + "]:" + std::to_string(ep.port);
        }
        return ep.host + ":" + std::to_string(ep.port);
    }

    /// @brief Parse "host:port" or "[v6-host]:port" into an Endpoint.
    /// @param s The text to parse.
    /// @return A Result containing the Endpoint, or InvalidArgument.
    inline Result<Endpoint> parse_endpoint(std::string_view s) {
        auto make_err = [&](std::string msg) -> Result<Endpoint> {
            Error e{};
            e.code = Error::Code::InvalidArgument;
            e.message = std::move(msg) + ": '" + std::string(s) + "'";
            return Result<Endpoint>::err(std::move(e));
        };

        std::string_view host;
        std::string_view port;

        if (!s.empty() && s.front() == '[') {
            auto close = s.find(']');
            if (close == std::string_view::npos)
                return make_err("Unterminated IPv6 host");
            host = s.substr(1, close - 1);
            auto rest = s.substr(close + 1);
            if (rest.empty() || rest.front() != ':')
                return make_err("Missing port");
            port = rest.substr(1);
        } else {
            auto colon = s.rfind(':');
            if (colon == std::string_view::npos)
                return make_err("Missing port");
            host = s.substr(0, colon);
            port = s.substr(colon + 1);
        }

        if (host.empty()) return make_err("Missing host");
        if (port.empty()) return make_err("Missing port");

        unsigned value = 0;
        auto [ptr, ec] =
            std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size() ||
            value == 0 || value > 65535) {
            return make_err("Invalid port");
        }

        return Result<Endpoint>::ok(
            Endpoint{std::string(host), static_cast<std::uint16_t>(value)});
    }

}  // namespace tcp_driver

namespace std {
    template <>
    struct hash<tcp_driver::Endpoint> {
        size_t operator()(tcp_driver::Endpoint const& e) const noexcept {
            // FNV-1a over host bytes, then the port.
            size_t h = 1469598103934665603ull;
            for (unsigned char c : e.host) {
                h ^= c;
                h *= 1099511628211ull;
            }
            h ^= static_cast<size_t>(e.port);
            h *= 1099511628211ull;
            return h;
        }
    };
}  // namespace std
