#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace tcp_driver {

    template <typename T>
    class Result;

    namespace detail {
        template <typename T>
        struct result_value {};

        template <typename T>
        struct result_value<Result<T>> {
            using type = T;
        };
    }  // namespace detail

    /// @brief Result<T> holds either the value of a successful call or the
    /// Error that made it fail.
    /// @note Similar to std::expected<T, Error> in C++23. Pool, connection
    /// and driver calls all report failure this way; exceptions are reserved
    /// for programming errors such as invalid constructor arguments.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        using value_type = T;

        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        static Result err(Error error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief `if (result)` tests for success.
        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& { return *checked_value_(); }
        T& value() & { return *checked_value_(); }
        T&& value() && { return std::move(*checked_value_()); }

        const Error& error() const& { return *checked_error_(); }
        Error& error() & { return *checked_error_(); }
        Error&& error() && { return std::move(*checked_error_()); }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }
        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }
        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /**
         * @brief Map the value with f, passing an error through untouched.
         *
         * @code
         * Result<std::uint32_t> len = conn.read_exact(buf).transform(
         *     [&](std::size_t) { return decode_length(buf); });
         * @endcode
         */
        template <typename F>
        auto transform(F&& f) && -> Result<std::invoke_result_t<F&&, T&&>> {
            using R = Result<std::invoke_result_t<F&&, T&&>>;
            if (has_error()) return R::err(std::move(*this).error());
            return R::ok(std::forward<F>(f)(std::move(*this).value()));
        }

        /// @brief Continue with f (T -> Result<U>) on success; errors pass
        /// through without calling f.
        template <typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F&&, T&&> {
            using R = std::invoke_result_t<F&&, T&&>;
            static_assert(
                std::is_same_v<R,
                               Result<typename detail::result_value<R>::type>>,
                "and_then needs a callable returning a Result");
            if (has_error()) return R::err(std::move(*this).error());
            return std::forward<F>(f)(std::move(*this).value());
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        T* checked_value_() {
            T* p = value_ptr();
            assert(p && "Result::value() called on an error Result");
            return p;
        }
        const T* checked_value_() const {
            const T* p = value_ptr();
            assert(p && "Result::value() called on an error Result");
            return p;
        }

        Error* checked_error_() {
            Error* p = error_ptr();
            assert(p && "Result::error() called on a successful Result");
            return p;
        }
        const Error* checked_error_() const {
            const Error* p = error_ptr();
            assert(p && "Result::error() called on a successful Result");
            return p;
        }

        std::variant<T, Error> m_state;
    };

}  // namespace tcp_driver
