#pragma once
#include <memory>
#include <string>

namespace tcp_driver {

    struct AttemptContext;

    /**
     * @brief Represents an error that occurred while obtaining or using a
     * pooled connection.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            NoConnectionAvailable, /**< No usable endpoint is left to try. */
            AcquisitionTimeout,    /**< The pool had no connection in time. */
            OperationError,        /**< The user operation failed. */
            AttemptFailed,  /**< Every endpoint attempt failed; see attempt. */
            ConnectionFailed,      /**< Failed to establish a TCP connection. */
            PoolClosed,            /**< The pool has been closed. */
            Timeout,               /**< A socket operation timed out. */
            ReadFailed,            /**< Failed to read from the connection. */
            WriteFailed,           /**< Failed to write to the connection. */
            ConnectionClosed,      /**< The connection is not open. */
            InvalidArgument,       /**< A caller supplied a bad argument. */
            InvalidConfiguration,  /**< Configuration could not be loaded. */
            Unknown,               /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /**
         * @brief Context of the last failed attempt, set for AttemptFailed
         * and for NoConnectionAvailable raised after a failed attempt.
         */
        std::shared_ptr<const AttemptContext> attempt{};
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::NoConnectionAvailable:
                return "NoConnectionAvailable";
            case Error::Code::AcquisitionTimeout:
                return "AcquisitionTimeout";
            case Error::Code::OperationError:
                return "OperationError";
            case Error::Code::AttemptFailed:
                return "AttemptFailed";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::PoolClosed:
                return "PoolClosed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::ReadFailed:
                return "ReadFailed";
            case Error::Code::WriteFailed:
                return "WriteFailed";
            case Error::Code::ConnectionClosed:
                return "ConnectionClosed";
            case Error::Code::InvalidArgument:
                return "InvalidArgument";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace tcp_driver
