#pragma once

#include <array>
#include <boost/endian/conversion.hpp>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "tcp_driver/connection/connection.hpp"
#include "tcp_driver/result.hpp"

/**
 * Helpers for simple length-prefixed binary protocols on top of a
 * Connection. All integers are big-endian (network order).
 */
namespace tcp_driver::stream {

    /// @brief Default upper bound accepted by read_string().
    inline constexpr std::uint32_t kDefaultMaxStringLength = 16 * 1024 * 1024;

    inline Result<std::size_t> write_bytes(Connection& conn,
                                           std::span<const std::uint8_t> data) {
        return conn.write(data);
    }

    inline Result<std::vector<std::uint8_t>> read_bytes(Connection& conn,
                                                        std::size_t n) {
        std::vector<std::uint8_t> out(n);
        if (n == 0) return Result<std::vector<std::uint8_t>>::ok();

        return conn.read_exact(out).transform(
            [&](std::size_t) { return std::move(out); });
    }

    template <typename Int>
    Result<std::size_t> write_int(Connection& conn, Int value) {
        static_assert(std::is_integral_v<Int>, "write_int needs an integer");
        std::array<std::uint8_t, sizeof(Int)> buf{};
        const Int be = boost::endian::native_to_big(value);
        std::memcpy(buf.data(), &be, sizeof(Int));
        return conn.write(buf);
    }

    template <typename Int>
    Result<Int> read_int(Connection& conn) {
        static_assert(std::is_integral_v<Int>, "read_int needs an integer");
        std::array<std::uint8_t, sizeof(Int)> buf{};
        return conn.read_exact(buf).transform([&](std::size_t) {
            Int be{};
            std::memcpy(&be, buf.data(), sizeof(Int));
            return boost::endian::big_to_native(be);
        });
    }

    namespace detail {
        template <typename Len>
        Result<std::size_t> write_prefixed(Connection& conn,
                                           std::string_view s) {
            if (s.size() > std::numeric_limits<Len>::max()) {
                return Result<std::size_t>::err(
                    Error{Error::Code::InvalidArgument,
                          "String of " + std::to_string(s.size()) +
                              " bytes does not fit its length prefix"});
            }

            std::vector<std::uint8_t> frame(sizeof(Len) + s.size());
            const Len be = boost::endian::native_to_big(static_cast<Len>(s.size()));
            std::memcpy(frame.data(), &be, sizeof(Len));
            if (!s.empty()) {
                std::memcpy(frame.data() + sizeof(Len), s.data(), s.size());
            }
            return conn.write(frame);
        }

        template <typename Len>
        Result<std::string> read_prefixed(Connection& conn,
                                          std::uint32_t max_length) {
            return read_int<Len>(conn).and_then(
                [&](Len len) -> Result<std::string> {
                    if (len > max_length) {
                        // The payload is still on the wire; the stream is
                        // unusable.
                        conn.close();
                        return Result<std::string>::err(Error{
                            Error::Code::ReadFailed,
                            "String length " + std::to_string(len) +
                                " exceeds limit " +
                                std::to_string(max_length)});
                    }

                    std::string out(len, '\0');
                    if (out.empty()) return Result<std::string>::ok();

                    return conn
                        .read_exact(std::span<std::uint8_t>(
                            reinterpret_cast<std::uint8_t*>(out.data()),
                            out.size()))
                        .transform([&](std::size_t) { return std::move(out); });
                });
        }
    }  // namespace detail

    /// @brief Write s prefixed by its length as a u16.
    inline Result<std::size_t> write_short_string(Connection& conn,
                                                  std::string_view s) {
        return detail::write_prefixed<std::uint16_t>(conn, s);
    }

    inline Result<std::string> read_short_string(Connection& conn) {
        return detail::read_prefixed<std::uint16_t>(
            conn, std::numeric_limits<std::uint16_t>::max());
    }

    /// @brief Write s prefixed by its length as a u32.
    inline Result<std::size_t> write_string(Connection& conn,
                                            std::string_view s) {
        return detail::write_prefixed<std::uint32_t>(conn, s);
    }

    /// @brief Read a u32-prefixed string.
    /// @note Lengths above max_length fail with ReadFailed and close conn.
    inline Result<std::string> read_string(
        Connection& conn, std::uint32_t max_length = kDefaultMaxStringLength) {
        return detail::read_prefixed<std::uint32_t>(conn, max_length);
    }

}  // namespace tcp_driver::stream
