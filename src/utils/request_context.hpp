/*
 * request_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DEQ_UTILS_REQUEST_CONTEXT_HPP
#define DEQ_UTILS_REQUEST_CONTEXT_HPP

#include <string>

#include "atom/utils/uuid.hpp"

namespace deq::utils {

/**
 * @brief Origin of an API call, carried explicitly into detached work so that
 * log lines can be correlated with the request that triggered them.
 */
struct RequestContext {
    std::string requestId;  ///< Empty for internally triggered work
    std::string sourceIp;

    static auto create(std::string sourceIp = {}) -> RequestContext {
        return RequestContext{atom::utils::UUID().toString(),
                              std::move(sourceIp)};
    }

    /**
     * @brief Short tag for log lines, e.g. "[req 1f0c.. from 10.0.0.5]".
     */
    [[nodiscard]] auto tag() const -> std::string {
        if (requestId.empty()) {
            return "[internal]";
        }
        std::string out = "[req " + requestId;
        if (!sourceIp.empty()) {
            out += " from " + sourceIp;
        }
        out += "]";
        return out;
    }
};

}  // namespace deq::utils

#endif  // DEQ_UTILS_REQUEST_CONTEXT_HPP
