// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_TESTS_UTIL_H_
#define BTCRPC_TESTS_UTIL_H_

#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <cstdint>
#include <map>
#include <microhttpd.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace btcrpc::test {
    /// HTTP request as received by \ref mock_daemon.
    struct http_request {
        /// e.g. "POST / HTTP/1.1".
        std::string m_request_line;
        /// Header fields keyed by lower-cased name.
        std::map<std::string, std::string> m_headers;
        std::string m_body;
    };

    /// \brief HTTP server standing in for a daemon's RPC port.
    ///
    /// Serves on an ephemeral localhost port using libmicrohttpd, records
    /// every request and answers each one with the configured status and
    /// body.
    class mock_daemon {
      public:
        mock_daemon() = default;

        /// Stops the server.
        ~mock_daemon();

        mock_daemon(const mock_daemon&) = delete;
        auto operator=(const mock_daemon&) -> mock_daemon& = delete;
        mock_daemon(mock_daemon&&) = delete;
        auto operator=(mock_daemon&&) -> mock_daemon& = delete;

        /// Starts listening and serving requests on the server's internal
        /// thread.
        /// \return true if the listener started successfully.
        auto init() -> bool;

        /// Sets the response returned for subsequent requests.
        void set_response(unsigned int status, std::string body);

        /// Returns the endpoint URL of the daemon, e.g.
        /// http://127.0.0.1:40000/.
        [[nodiscard]] auto url() const -> std::string;

        /// Returns the port the daemon is listening on.
        [[nodiscard]] auto port() const -> uint16_t;

        /// Returns a copy of the requests received so far.
        [[nodiscard]] auto requests() const -> std::vector<http_request>;

      private:
        struct pending_request {
            http_request m_request;
        };

        MHD_Daemon* m_daemon{};
        uint16_t m_port{};

        mutable std::mutex m_mut;
        unsigned int m_status{MHD_HTTP_OK};
        std::string m_body{"{\"result\":null,\"error\":null,\"id\":1}"};
        std::vector<http_request> m_requests;

        std::mutex m_pending_mut;
        std::map<pending_request*, std::unique_ptr<pending_request>>
            m_pending;

        static auto callback(void* cls,
                             struct MHD_Connection* connection,
                             const char* url,
                             const char* method,
                             const char* version,
                             const char* upload_data,
                             size_t* upload_data_size,
                             void** con_cls) -> MHD_Result;

        static auto collect_header(void* cls,
                                   enum MHD_ValueKind kind,
                                   const char* key,
                                   const char* value) -> MHD_Result;

        static void request_complete(void* cls,
                                     struct MHD_Connection* connection,
                                     void** con_cls,
                                     MHD_RequestTerminationCode toe);

        auto respond(MHD_Connection* connection, pending_request* req)
            -> MHD_Result;
    };

    /// Returns an unused localhost port with nothing listening on it.
    auto closed_port() -> uint16_t;

    /// Returns a logger that only prints fatal statements.
    auto quiet_log() -> std::shared_ptr<logging::log>;

    /// Loads the given config file into an options struct and asserts there
    /// was not an error.
    /// \param config_file path to config file to load and parse.
    /// \param opts options struct in which to place the result.
    void load_config(const std::string& config_file,
                     btcrpc::config::options& opts);
}

#endif // BTCRPC_TESTS_UTIL_H_
