// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading client options from a configuration file and the
 * environment.
 */

#ifndef BTCRPC_SRC_UTIL_COMMON_CONFIG_H_
#define BTCRPC_SRC_UTIL_COMMON_CONFIG_H_

#include "logging.hpp"
#include "rpc/credentials.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace btcrpc::config {
    namespace defaults {
        /// No request timeout. Timeouts are left to libcurl.
        static constexpr long rpc_timeout{0};

        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto rpc_endpoint_key = "rpc_endpoint";
    static constexpr auto rpc_user_key = "rpc_user";
    static constexpr auto rpc_password_key = "rpc_password";
    static constexpr auto rpc_timeout_key = "rpc_timeout";
    static constexpr auto loglevel_key = "loglevel";

    /// Client configuration options.
    struct options {
        /// Endpoint URL and Basic authentication details of the daemon.
        rpc::credentials m_credentials;
        /// Total time allowed for a single call in milliseconds. 0 for no
        /// timeout.
        long m_rpc_timeout{defaults::rpc_timeout};
        /// Log level for the client's logger.
        logging::log_level m_loglevel{defaults::log_level};
    };

    /// Reads configuration parameters line-by-line from a file or stream.
    /// Expects the format `key=value` on each line. Double-quoted values are
    /// strings and anything else must be a signed integer; other values are
    /// ignored. Every key can be overridden by an environment variable with
    /// the same name in upper case.
    class parser {
      public:
        /// Constructor.
        /// \param filename path to the config file to read.
        explicit parser(const std::string& filename);

        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns true if the config file given to the constructor could be
        /// opened. Always true for the stream constructor.
        [[nodiscard]] auto good() const -> bool;

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is an integer.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not an integer or doesn't exist.
        [[nodiscard]] auto get_long(const std::string& key) const
            -> std::optional<int64_t>;

        /// Return the value for the given key if its value is a loglevel.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a loglevel or does not exist.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

      private:
        using value_t = std::variant<std::string, int64_t>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }
            return std::nullopt;
        }

        void init(std::istream& stream);

        static auto parse_value(const std::string& value)
            -> std::optional<value_t>;

        bool m_good{true};
        std::unordered_map<std::string, value_t> m_options;
    };

    /// Reads the client options from the given parser.
    /// \param cfg parser holding the configuration values.
    /// \return options struct with all required values, or string with error
    ///         message on failure.
    auto read_options(const parser& cfg) -> std::variant<options, std::string>;

    /// Reads the client options from the given config file.
    /// \param config_file the path to the config file from which to load
    ///                    options.
    /// \return options struct with all required values, or string with error
    ///         message on failure.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Loads options from the given config file and check for invariants.
    /// \param config_file the path to the config file from which load options.
    /// \return valid options struct, or string with error message on failure.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants.
    /// \param opts options struct to check.
    /// \return std::nullopt if the struct satisfies all invariants. Error
    ///         string otherwise.
    auto check_options(const options& opts) -> std::optional<std::string>;
}

#endif
