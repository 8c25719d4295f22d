#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "tcp_driver/config.hpp"
#include "tcp_driver/endpoint.hpp"
#include "tcp_driver/result.hpp"

/**
 * JSON binding for the configuration structs.
 *
 * Every key is optional except "hosts"; missing keys keep the struct
 * defaults. Durations are integers in milliseconds under "*_ms" keys.
 *
 * {
 *   "hosts": ["db1:7000", {"host": "db2", "port": 7000}],
 *   "routing": {"blacklist_ttl_ms": 30000, "seed": 1},
 *   "pool": {"max_total_connections": 16, "connection": {"tls": true}},
 *   "retry": {"max_attempts": 3, "initial_backoff_ms": 50}
 * }
 */
namespace tcp_driver {

    namespace detail {
        template <typename T>
        void read_key(const nlohmann::json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null()) it->get_to(out);
        }

        inline void read_ms(const nlohmann::json& j, const char* key,
                            std::chrono::milliseconds& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            out = std::chrono::milliseconds{it->get<std::int64_t>()};
        }
    }  // namespace detail

    /// @brief Accepts "host:port" or {"host": ..., "port": ...}.
    inline void from_json(const nlohmann::json& j, Endpoint& ep) {
        if (j.is_string()) {
            auto parsed = parse_endpoint(j.get_ref<const std::string&>());
            if (!parsed) throw std::invalid_argument(parsed.error().message);
            ep = std::move(parsed).value();
            return;
        }
        j.at("host").get_to(ep.host);
        if (ep.host.empty()) {
            throw std::invalid_argument("Endpoint needs a host");
        }
        // get_to(uint16_t) would wrap out-of-range ports silently.
        const auto port = j.at("port").get<std::int64_t>();
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("Endpoint port " +
                                        std::to_string(port) +
                                        " is outside 1..65535");
        }
        ep.port = static_cast<std::uint16_t>(port);
    }

    inline void from_json(const nlohmann::json& j, ConnectionOptions& o) {
        detail::read_ms(j, "connect_timeout_ms", o.connect_timeout);
        detail::read_ms(j, "io_timeout_ms", o.io_timeout);
        detail::read_key(j, "tls", o.tls);
        detail::read_key(j, "verify_tls", o.verify_tls);
        detail::read_key(j, "tcp_no_delay", o.tcp_no_delay);
        detail::read_key(j, "keep_alive", o.keep_alive);
    }

    inline void from_json(const nlohmann::json& j,
                          ConnectionPoolConfiguration& c) {
        detail::read_key(j, "max_total_connections", c.max_total_connections);
        detail::read_key(j, "max_connections_per_endpoint",
                         c.max_connections_per_endpoint);
        detail::read_ms(j, "connection_idle_ttl_ms", c.connection_idle_ttl);
        detail::read_key(j, "max_connection_reuse_count",
                         c.max_connection_reuse_count);
        detail::read_ms(j, "max_connection_age_ms", c.max_connection_age);
        detail::read_key(j, "test_on_borrow", c.test_on_borrow);
        detail::read_key(j, "connection", c.connection);
    }

    inline void from_json(const nlohmann::json& j,
                          RoutingPolicyConfiguration& c) {
        detail::read_ms(j, "blacklist_ttl_ms", c.blacklist_ttl);
        auto it = j.find("seed");
        if (it != j.end() && !it->is_null()) c.seed = it->get<std::uint64_t>();
    }

    inline void from_json(const nlohmann::json& j,
                          RetryPolicyConfiguration& c) {
        detail::read_key(j, "max_attempts", c.max_attempts);
        detail::read_ms(j, "initial_backoff_ms", c.initial_backoff);
        detail::read_key(j, "backoff_multiplier", c.backoff_multiplier);
        detail::read_ms(j, "max_backoff_ms", c.max_backoff);
    }

    inline void from_json(const nlohmann::json& j, DriverConfiguration& c) {
        j.at("hosts").get_to(c.hosts);
        detail::read_key(j, "routing", c.routing);
        detail::read_key(j, "pool", c.pool);
        detail::read_key(j, "retry", c.retry);
    }

    /// @brief Parse a DriverConfiguration from JSON text.
    /// @return The configuration, or InvalidConfiguration describing the
    /// first problem found.
    inline Result<DriverConfiguration> load_configuration(
        std::string_view text) {
        using R = Result<DriverConfiguration>;
        auto invalid = [](std::string msg) {
            return R::err(Error{Error::Code::InvalidConfiguration,
                                "Invalid driver configuration: " +
                                    std::move(msg)});
        };

        DriverConfiguration cfg;
        try {
            nlohmann::json::parse(text.begin(), text.end()).get_to(cfg);
        } catch (const nlohmann::json::exception& e) {
            return invalid(e.what());
        } catch (const std::invalid_argument& e) {
            return invalid(e.what());
        }

        if (cfg.hosts.empty()) return invalid("no hosts configured");
        return R::ok(std::move(cfg));
    }

    /// @brief load_configuration() on the contents of a file.
    inline Result<DriverConfiguration> load_configuration_file(
        const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return Result<DriverConfiguration>::err(
                Error{Error::Code::InvalidConfiguration,
                      "Cannot open configuration file " + path});
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return load_configuration(buf.str());
    }

}  // namespace tcp_driver
