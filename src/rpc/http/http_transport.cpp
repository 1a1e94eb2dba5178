// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "http_transport.hpp"

#include <array>

namespace btcrpc::rpc {
    namespace {
        struct easy_handle_deleter {
            void operator()(CURL* handle) const {
                curl_easy_cleanup(handle);
            }
        };

        struct slist_deleter {
            void operator()(curl_slist* list) const {
                curl_slist_free_all(list);
            }
        };

        struct url_deleter {
            void operator()(CURLU* url) const {
                curl_url_cleanup(url);
            }
        };

        /// Returns the requested URL part, or an empty string if it is not
        /// present.
        auto get_url_part(CURLU* url, CURLUPart what) -> std::string {
            char* part{};
            if(curl_url_get(url, what, &part, 0) != CURLUE_OK) {
                return {};
            }
            auto ret = std::string(part);
            curl_free(part);
            return ret;
        }
    }

    curl_initializer::curl_initializer() {
        curl_global_init(CURL_GLOBAL_ALL);
    }

    curl_initializer::~curl_initializer() {
        curl_global_cleanup();
    }

    void curl_initializer::ensure() {
        static const curl_initializer curl_init{};
    }

    http_transport::http_transport(credentials creds,
                                   long timeout,
                                   std::shared_ptr<logging::log> log)
        : m_creds(std::move(creds)),
          m_timeout(timeout),
          m_log(std::move(log)) {
        curl_initializer::ensure();
        parse_url();
    }

    void http_transport::parse_url() {
        auto url = std::unique_ptr<CURLU, url_deleter>(curl_url());
        if(!url) {
            m_log->fatal("Failed to allocate URL handle");
        }

        auto rc = curl_url_set(url.get(),
                               CURLUPART_URL,
                               m_creds.m_url.c_str(),
                               0);
        if(rc != CURLUE_OK) {
            m_log->fatal("Malformed RPC endpoint URL",
                         "\"" + m_creds.m_url + "\":",
                         curl_url_strerror(rc));
        }

        auto scheme = get_url_part(url.get(), CURLUPART_SCHEME);
        if(scheme != "http" && scheme != "https") {
            m_log->fatal("Unsupported scheme in RPC endpoint URL",
                         "\"" + m_creds.m_url + "\"");
        }

        auto host = get_url_part(url.get(), CURLUPART_HOST);
        if(host.empty()) {
            m_log->fatal("Missing host in RPC endpoint URL",
                         "\"" + m_creds.m_url + "\"");
        }

        m_authority = host;
        auto port = get_url_part(url.get(), CURLUPART_PORT);
        if(!port.empty()) {
            m_authority += ":" + port;
        }
        m_url = get_url_part(url.get(), CURLUPART_URL);

        m_log->debug("RPC endpoint",
                     m_url,
                     "authority",
                     m_authority,
                     "realm",
                     auth_realm);
    }

    auto http_transport::post(const std::string& body) const
        -> std::variant<std::string, transport_error> {
        auto handle = std::unique_ptr<CURL, easy_handle_deleter>(
            curl_easy_init());
        if(!handle) {
            return transport_error{"Failed to initialize CURL handle"};
        }

        auto content_length
            = "Content-Length: " + std::to_string(body.size());
        curl_slist* hdrs{};
        hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
        hdrs = curl_slist_append(hdrs, content_length.c_str());
        hdrs = curl_slist_append(hdrs, "Expect:");
        auto headers = std::unique_ptr<curl_slist, slist_deleter>(hdrs);

        std::string response;
        std::array<char, CURL_ERROR_SIZE> err_buf{};

        auto* h = handle.get();
        curl_easy_setopt(h, CURLOPT_URL, m_url.c_str());
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_VERBOSE, 0L);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, err_buf.data());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h,
                         CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(h, CURLOPT_USERNAME, m_creds.m_user.c_str());
        curl_easy_setopt(h, CURLOPT_PASSWORD, m_creds.m_password.c_str());
        // Credentials only go to the configured authority.
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(h, CURLOPT_UNRESTRICTED_AUTH, 0L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, m_timeout);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_data);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);

        auto res = curl_easy_perform(h);
        if(res != CURLE_OK) {
            auto msg = std::string(err_buf.data());
            if(msg.empty()) {
                msg = curl_easy_strerror(res);
            }
            m_log->debug("CURL error:", msg, "endpoint:", m_authority);
            return transport_error{std::move(msg)};
        }

        long http_code = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);
        m_log->debug("HTTP",
                     http_code,
                     "from",
                     m_authority,
                     "(",
                     response.size(),
                     "bytes )");

        return response;
    }

    auto http_transport::authority() const -> const std::string& {
        return m_authority;
    }

    auto http_transport::url() const -> const std::string& {
        return m_url;
    }

    auto http_transport::write_data(void* ptr,
                                    size_t size,
                                    size_t nmemb,
                                    std::string* out) -> size_t {
        auto total_sz = size * nmemb;
        out->append(static_cast<char*>(ptr), total_sz);
        return total_sz;
    }
}
