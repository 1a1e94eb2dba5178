// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_RPC_CLIENT_H_
#define BTCRPC_SRC_RPC_CLIENT_H_

#include "envelope.hpp"
#include "error.hpp"
#include "http/http_transport.hpp"
#include "rpc/credentials.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <json/json.h>
#include <memory>
#include <string>
#include <variant>

namespace btcrpc::rpc {
    /// \brief Synchronous JSON-RPC client for a cryptocurrency daemon.
    ///
    /// Each call builds a request envelope, POSTs it over HTTP with Basic
    /// authentication, and decodes the response envelope into the caller's
    /// result type. Calls block until the response has been decoded. The
    /// client holds no per-call state and may be shared between threads.
    class client {
      public:
        /// Construct a new client.
        /// \param creds endpoint URL and Basic authentication details. A
        ///              malformed URL terminates the process.
        /// \param timeout total time allowed per call in milliseconds. 0 for
        ///                no timeout.
        /// \param log log instance.
        client(credentials creds,
               long timeout,
               std::shared_ptr<logging::log> log);

        /// Construct a new client from configuration options.
        /// \param opts client options, see \ref config::load_options.
        /// \param log log instance.
        client(const config::options& opts,
               std::shared_ptr<logging::log> log);

        /// \brief Calls the given method and decodes its result as T.
        /// \tparam T expected result type. Must have a \ref json_decoder.
        /// \param method name of the remote procedure.
        /// \param params positional parameters, see \ref make_params.
        /// \return the result, or the reason the call failed.
        template<typename T>
        [[nodiscard]] auto call(const std::string& method,
                                Json::Value params
                                = Json::Value(Json::arrayValue)) const
            -> call_result<T> {
            auto raw = call_raw(method, std::move(params));
            if(auto* err = std::get_if<transport_error>(&raw)) {
                return call_result<T>(std::in_place_index<1>,
                                      std::move(*err));
            }
            auto res = decode_response<T>(std::get<std::string>(raw));
            if(const auto* err = std::get_if<1>(&res)) {
                log_failure(method, *err);
            }
            return res;
        }

        /// Calls the given method and returns the raw response body without
        /// decoding it.
        /// \param method name of the remote procedure.
        /// \param params positional parameters.
        /// \return response body, or a transport error.
        [[nodiscard]] auto call_raw(const std::string& method,
                                    Json::Value params
                                    = Json::Value(Json::arrayValue)) const
            -> std::variant<std::string, transport_error>;

        /// Returns the transport used by this client.
        [[nodiscard]] auto transport() const -> const http_transport&;

      private:
        http_transport m_transport;
        std::shared_ptr<logging::log> m_log;

        void log_failure(const std::string& method,
                         const call_error& err) const;
    };

    /// Makes a single call without keeping a client around.
    /// \see client::call
    template<typename T>
    auto call_api(const credentials& creds,
                  const std::string& method,
                  Json::Value params,
                  std::shared_ptr<logging::log> log) -> call_result<T> {
        const auto cl = client(creds, 0, std::move(log));
        return cl.call<T>(method, std::move(params));
    }
}

#endif
