// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_RPC_ERROR_H_
#define BTCRPC_SRC_RPC_ERROR_H_

#include <cstdint>
#include <string>
#include <variant>

namespace btcrpc::rpc {
    /// Error object reported by the daemon in the response envelope.
    struct api_error {
        /// JSON-RPC error code, e.g. -32601 for an unknown method.
        int64_t m_code{};
        /// Human readable message from the daemon.
        std::string m_message;

        auto operator==(const api_error& rhs) const -> bool;
    };

    /// The response could not be parsed into the expected envelope or result
    /// type. Covers malformed JSON, missing fields and type mismatches.
    struct result_type_error {
        /// Raw response body, unmodified.
        std::string m_raw;

        auto operator==(const result_type_error& rhs) const -> bool;
    };

    /// No HTTP response was obtained for the request.
    struct transport_error {
        /// libcurl diagnostic message.
        std::string m_message;

        auto operator==(const transport_error& rhs) const -> bool;
    };

    /// Failure of a single call.
    using call_error
        = std::variant<api_error, result_type_error, transport_error>;

    /// Result of a call returning a value of type T, or the reason the call
    /// failed.
    template<typename T>
    using call_result = std::variant<T, call_error>;

    /// Returns a one-line description of the error suitable for logging.
    auto to_string(const call_error& err) -> std::string;
}

#endif
