// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_RPC_HTTP_HTTP_TRANSPORT_H_
#define BTCRPC_SRC_RPC_HTTP_HTTP_TRANSPORT_H_

#include "rpc/credentials.hpp"
#include "rpc/error.hpp"
#include "util/common/logging.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>
#include <variant>

namespace btcrpc::rpc {
    /// Class for performing libcurl global initialization.
    class curl_initializer {
      public:
        /// Initializes libcurl on first use. Deinitialized at process exit.
        static void ensure();

        /// Initializes libcurl.
        curl_initializer();
        /// Deinitializes libcurl.
        ~curl_initializer();

        curl_initializer(const curl_initializer&) = delete;
        auto operator=(const curl_initializer&) -> curl_initializer& = delete;
        curl_initializer(curl_initializer&&) = delete;
        auto operator=(curl_initializer&&) -> curl_initializer& = delete;
    };

    /// \brief Synchronous HTTP transport for JSON-RPC requests.
    ///
    /// Performs one authenticated HTTP POST per call using a libcurl easy
    /// handle owned by that call. Holds no mutable state after construction,
    /// so a single instance may be used from several threads at once.
    class http_transport {
      public:
        /// Realm to which the Basic authentication credentials belong.
        static constexpr auto auth_realm = "jsonrpc";

        /// \brief Construct a new transport.
        ///
        /// Initializes libcurl if no transport has done so yet, then parses
        /// the endpoint URL. A malformed URL, or one with a scheme
        /// other than http or https, is logged as fatal and terminates the
        /// process.
        /// \param creds endpoint URL and Basic authentication details.
        /// \param timeout total request timeout in milliseconds. 0 for no
        ///                timeout.
        /// \param log log instance.
        http_transport(credentials creds,
                       long timeout,
                       std::shared_ptr<logging::log> log);

        /// POSTs the body to the endpoint and returns the response body. The
        /// HTTP status code is not inspected.
        /// \param body serialized JSON-RPC request.
        /// \return raw response body, or a transport error if no response
        ///         was received.
        [[nodiscard]] auto post(const std::string& body) const
            -> std::variant<std::string, transport_error>;

        /// Returns the host[:port] the credentials are sent to.
        [[nodiscard]] auto authority() const -> const std::string&;

        /// Returns the normalized endpoint URL.
        [[nodiscard]] auto url() const -> const std::string&;

      private:
        const credentials m_creds;
        std::string m_url;
        std::string m_authority;
        long m_timeout;
        std::shared_ptr<logging::log> m_log;

        void parse_url();

        static auto write_data(void* ptr,
                               size_t size,
                               size_t nmemb,
                               std::string* out) -> size_t;
    };
}

#endif
