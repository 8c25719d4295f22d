#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "../endpoint.hpp"  // Endpoint
#include "../result.hpp"    // Result, Error

namespace tcp_driver {

    /**
     * @brief A pooled byte-stream connection to one endpoint.
     *
     * A connection is exclusively owned by a single operation between acquire
     * and release/invalidate; implementations need not be thread-safe.
     * Any failed read or write leaves the connection closed.
     */
    class Connection {
       public:
        virtual ~Connection() = default;

        /// @brief The endpoint this connection is tied to.
        [[nodiscard]] virtual const Endpoint& endpoint() const noexcept = 0;

        /// @brief Whether the connection is currently open.
        [[nodiscard]] virtual bool is_open() const noexcept = 0;

        /// @brief Write all of data.
        /// @return The number of bytes written (data.size()) or an Error.
        virtual Result<std::size_t> write(
            std::span<const std::uint8_t> data) = 0;

        /// @brief Read whatever is available, at least one byte.
        virtual Result<std::size_t> read_some(
            std::span<std::uint8_t> out) = 0;

        /// @brief Read exactly out.size() bytes.
        virtual Result<std::size_t> read_exact(std::span<std::uint8_t> out) {
            std::size_t total = 0;
            while (total < out.size()) {
                auto r = read_some(out.subspan(total));
                if (!r) return r;
                total += r.value();
            }
            return Result<std::size_t>::ok(total);
        }

        /// @brief Close the connection (best-effort, idempotent).
        virtual void close() noexcept = 0;
    };

}  // namespace tcp_driver
