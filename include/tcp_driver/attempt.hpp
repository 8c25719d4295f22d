#pragma once

#include <cstddef>
#include <vector>

#include "endpoint.hpp"
#include "error.hpp"

namespace tcp_driver {

    /**
     * @brief Context of one failed attempt against a specific endpoint.
     *
     * Attached to an Error of code AttemptFailed once the endpoint-level
     * failover of a send is exhausted.
     */
    struct AttemptContext {
        /** @brief The acquisition or operation error of the attempt. */
        Error cause;
        /** @brief The endpoint the attempt was made against. */
        Endpoint endpoint;
        /** @brief Zero-based index of the attempt within its send call. */
        std::size_t attempt_index{0};
        /** @brief Hosts known to the routing policy after the failure. */
        std::vector<Endpoint> hosts;
    };

    /// @brief Follow AttemptFailed wrappers down to the originating error.
    inline const Error& root_cause(const Error& e) noexcept {
        const Error* cur = &e;
        while (cur->code == Error::Code::AttemptFailed && cur->attempt) {
            cur = &cur->attempt->cause;
        }
        return *cur;
    }

}  // namespace tcp_driver
