// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

namespace btcrpc::rpc {
    client::client(credentials creds,
                   long timeout,
                   std::shared_ptr<logging::log> log)
        : m_transport(std::move(creds), timeout, log),
          m_log(std::move(log)) {}

    client::client(const config::options& opts,
                   std::shared_ptr<logging::log> log)
        : client(opts.m_credentials, opts.m_rpc_timeout, std::move(log)) {}

    auto client::call_raw(const std::string& method, Json::Value params) const
        -> std::variant<std::string, transport_error> {
        auto body = encode_request(method, std::move(params));
        m_log->trace("RPC request to", m_transport.authority(), body);

        auto res = m_transport.post(body);
        if(const auto* raw = std::get_if<std::string>(&res)) {
            m_log->trace("RPC response from", m_transport.authority(), *raw);
        } else {
            log_failure(method, std::get<transport_error>(res));
        }
        return res;
    }

    auto client::transport() const -> const http_transport& {
        return m_transport;
    }

    void client::log_failure(const std::string& method,
                             const call_error& err) const {
        if(std::holds_alternative<api_error>(err)) {
            // The daemon answered; the caller decides whether it matters.
            m_log->debug(method, "failed:", to_string(err));
            return;
        }
        m_log->warn(method, "failed:", to_string(err));
    }
}
