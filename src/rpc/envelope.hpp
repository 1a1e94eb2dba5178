// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_RPC_ENVELOPE_H_
#define BTCRPC_SRC_RPC_ENVELOPE_H_

#include "error.hpp"
#include "json_format.hpp"

#include <json/json.h>
#include <optional>
#include <string>
#include <utility>

namespace btcrpc::rpc {
    static constexpr auto json_rpc_version = "2.0";
    /// Every request carries the same id. Responses are matched to requests
    /// by the HTTP exchange they arrive on, not by id.
    static constexpr int request_id = 1;

    static constexpr auto jsonrpc_key = "jsonrpc";
    static constexpr auto method_key = "method";
    static constexpr auto params_key = "params";
    static constexpr auto id_key = "id";
    static constexpr auto result_key = "result";
    static constexpr auto error_key = "error";
    static constexpr auto code_key = "code";
    static constexpr auto message_key = "message";

    /// Decoded outer structure of a response.
    struct response_envelope {
        /// Untyped call result.
        Json::Value m_result;
        /// Error reported by the daemon, or std::nullopt if the error field
        /// was null.
        std::optional<api_error> m_error;
    };

    /// \brief Builds the request object for a call.
    ///
    /// A null params value becomes an empty array; any other non-array value
    /// becomes the single element of the params array.
    /// \param method name of the remote procedure.
    /// \param params positional parameters.
    /// \return {"jsonrpc":"2.0","method":method,"params":[...],"id":1}
    auto make_request(const std::string& method, Json::Value params)
        -> Json::Value;

    /// Serializes the request object for a call as compact JSON. Decimals
    /// are written with up to 16 significant digits, so every amount is
    /// printed exactly.
    /// \see make_request
    auto encode_request(const std::string& method, Json::Value params)
        -> std::string;

    /// \brief Parses the response envelope.
    ///
    /// The body must be a single strict JSON object containing both the
    /// `result` and `error` fields. `error` must be null or an object with
    /// an integer `code` and a string `message`. Other fields are ignored.
    /// \param raw response body.
    /// \return decoded envelope, or std::nullopt if the body did not match.
    auto parse_response(const std::string& raw)
        -> std::optional<response_envelope>;

    /// \brief Decodes a response body into a typed result.
    ///
    /// A daemon error takes precedence over the result field, which is
    /// usually null alongside an error.
    /// \tparam T expected result type. Must have a \ref json_decoder.
    /// \param raw response body.
    /// \return decoded result, the daemon's api_error, or result_type_error
    ///         carrying raw if the envelope or result could not be decoded.
    template<typename T>
    auto decode_response(const std::string& raw) -> call_result<T> {
        auto env = parse_response(raw);
        if(!env.has_value()) {
            return call_result<T>(std::in_place_index<1>,
                                  result_type_error{raw});
        }
        if(env->m_error.has_value()) {
            return call_result<T>(std::in_place_index<1>,
                                  std::move(env->m_error.value()));
        }
        auto val = json_decoder<T>::decode(env->m_result);
        if(!val.has_value()) {
            return call_result<T>(std::in_place_index<1>,
                                  result_type_error{raw});
        }
        return call_result<T>(std::in_place_index<0>, std::move(val.value()));
    }
}

#endif
