// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <gtest/gtest.h>

namespace btcrpc::test {
    namespace {
        /// Starts a daemon on an ephemeral port bound to 127.0.0.1.
        auto start_localhost_daemon(MHD_AccessHandlerCallback handler,
                                    void* handler_cls,
                                    MHD_RequestCompletedCallback completed,
                                    void* completed_cls) -> MHD_Daemon* {
            auto addr = sockaddr_in{};
            addr.sin_family = AF_INET;
            addr.sin_port = 0;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            return MHD_start_daemon(MHD_USE_POLL_INTERNALLY,
                                    0,
                                    nullptr,
                                    nullptr,
                                    handler,
                                    handler_cls,
                                    MHD_OPTION_NOTIFY_COMPLETED,
                                    completed,
                                    completed_cls,
                                    MHD_OPTION_SOCK_ADDR,
                                    &addr,
                                    MHD_OPTION_END);
        }

        auto bound_port(MHD_Daemon* daemon) -> uint16_t {
            const auto* inf
                = MHD_get_daemon_info(daemon, MHD_DAEMON_INFO_BIND_PORT);
            if(inf == nullptr) {
                return 0;
            }
            return inf->port;
        }

        auto refuse_all(void* /* cls */,
                        struct MHD_Connection* /* connection */,
                        const char* /* url */,
                        const char* /* method */,
                        const char* /* version */,
                        const char* /* upload_data */,
                        size_t* /* upload_data_size */,
                        void** /* con_cls */) -> MHD_Result {
            return MHD_NO;
        }
    }

    mock_daemon::~mock_daemon() {
        if(m_daemon != nullptr) {
            MHD_stop_daemon(m_daemon);
        }
    }

    auto mock_daemon::init() -> bool {
        m_daemon
            = start_localhost_daemon(callback, this, request_complete, this);
        if(m_daemon == nullptr) {
            return false;
        }
        m_port = bound_port(m_daemon);
        return m_port != 0;
    }

    void mock_daemon::set_response(unsigned int status, std::string body) {
        const std::lock_guard<std::mutex> l(m_mut);
        m_status = status;
        m_body = std::move(body);
    }

    auto mock_daemon::url() const -> std::string {
        return "http://127.0.0.1:" + std::to_string(m_port) + "/";
    }

    auto mock_daemon::port() const -> uint16_t {
        return m_port;
    }

    auto mock_daemon::requests() const -> std::vector<http_request> {
        const std::lock_guard<std::mutex> l(m_mut);
        return m_requests;
    }

    auto mock_daemon::callback(void* cls,
                               struct MHD_Connection* connection,
                               const char* url,
                               const char* method,
                               const char* version,
                               const char* upload_data,
                               size_t* upload_data_size,
                               void** con_cls) -> MHD_Result {
        auto* daemon = static_cast<mock_daemon*>(cls);
        if(*con_cls == nullptr) {
            auto new_req = std::make_unique<pending_request>();
            auto& req = new_req->m_request;
            req.m_request_line = std::string(method) + " " + url + " "
                               + version;
            MHD_get_connection_values(connection,
                                      MHD_HEADER_KIND,
                                      collect_header,
                                      &req.m_headers);
            *con_cls = new_req.get();
            {
                const std::lock_guard<std::mutex> l(daemon->m_pending_mut);
                daemon->m_pending.emplace(new_req.get(), std::move(new_req));
            }
            return MHD_YES;
        }

        auto* req = static_cast<pending_request*>(*con_cls);
        if(*upload_data_size != 0) {
            req->m_request.m_body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }

        return daemon->respond(connection, req);
    }

    auto mock_daemon::collect_header(void* cls,
                                     enum MHD_ValueKind /* kind */,
                                     const char* key,
                                     const char* value) -> MHD_Result {
        auto* headers = static_cast<std::map<std::string, std::string>*>(cls);
        auto name = std::string(key);
        std::transform(name.begin(),
                       name.end(),
                       name.begin(),
                       [](unsigned char c) {
                           return std::tolower(c);
                       });
        (*headers)[name] = value != nullptr ? value : "";
        return MHD_YES;
    }

    auto mock_daemon::respond(MHD_Connection* connection,
                              pending_request* req) -> MHD_Result {
        unsigned int status{};
        std::string body;
        {
            const std::lock_guard<std::mutex> l(m_mut);
            m_requests.push_back(req->m_request);
            status = m_status;
            body = m_body;
        }

        auto* response = MHD_create_response_from_buffer(
            body.size(),
            static_cast<void*>(body.data()),
            MHD_RESPMEM_MUST_COPY);
        if(response == nullptr) {
            return MHD_NO;
        }
        MHD_add_response_header(response, "Content-Type", "application/json");
        auto ret = MHD_queue_response(connection, status, response);
        MHD_destroy_response(response);
        return ret;
    }

    void mock_daemon::request_complete(void* cls,
                                       struct MHD_Connection* /* connection */,
                                       void** con_cls,
                                       MHD_RequestTerminationCode /* toe */) {
        if(*con_cls == nullptr) {
            return;
        }
        auto* req = static_cast<pending_request*>(*con_cls);
        auto* daemon = static_cast<mock_daemon*>(cls);
        const std::lock_guard<std::mutex> l(daemon->m_pending_mut);
        daemon->m_pending.erase(req);
    }

    auto closed_port() -> uint16_t {
        auto* daemon
            = start_localhost_daemon(refuse_all, nullptr, nullptr, nullptr);
        if(daemon == nullptr) {
            return 0;
        }
        auto port = bound_port(daemon);
        MHD_stop_daemon(daemon);
        return port;
    }

    auto quiet_log() -> std::shared_ptr<logging::log> {
        return std::make_shared<logging::log>(logging::log_level::fatal);
    }

    void load_config(const std::string& config_file,
                     btcrpc::config::options& opts) {
        auto cfg_or_err = btcrpc::config::load_options(config_file);
        ASSERT_TRUE(
            std::holds_alternative<btcrpc::config::options>(cfg_or_err))
            << std::get<std::string>(cfg_or_err);
        opts = std::get<btcrpc::config::options>(cfg_or_err);
    }
}
