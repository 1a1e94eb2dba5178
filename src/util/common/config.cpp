// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace btcrpc::config {
    namespace {
        auto read_required_string(const parser& cfg,
                                  const std::string& key,
                                  std::string& out)
            -> std::optional<std::string> {
            auto val = cfg.get_string(key);
            if(!val.has_value()) {
                return "Missing or non-string " + key
                     + " (string values must be double quoted)";
            }
            out = std::move(val.value());
            return std::nullopt;
        }
    }

    parser::parser(const std::string& filename) {
        std::ifstream file(filename);
        m_good = file.good();
        if(m_good) {
            init(file);
        }
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    auto parser::good() const -> bool {
        return m_good;
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value)) {
                    auto parsed = parse_value(value);
                    if(parsed.has_value()) {
                        m_options.insert_or_assign(key,
                                                   std::move(parsed.value()));
                    }
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_long(const std::string& key) const
        -> std::optional<int64_t> {
        return get_val<int64_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            auto parsed = parse_value(value);
            if(parsed.has_value()) {
                return parsed;
            }
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value)
        -> std::optional<value_t> {
        if(value.empty()) {
            return std::nullopt;
        }

        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        // Anything that is not entirely an integer is dropped, as if the key
        // were absent.
        try {
            size_t pos{};
            const auto as_int = std::stoll(value, &pos);
            if(pos != value.size()) {
                return std::nullopt;
            }
            return static_cast<int64_t>(as_int);
        } catch(const std::invalid_argument& /* e */) {
            return std::nullopt;
        } catch(const std::out_of_range& /* e */) {
            return std::nullopt;
        }
    }

    auto read_options(const parser& cfg)
        -> std::variant<options, std::string> {
        auto opts = options{};

        auto err = read_required_string(cfg,
                                        rpc_endpoint_key,
                                        opts.m_credentials.m_url);
        if(err.has_value()) {
            return err.value();
        }

        err = read_required_string(cfg,
                                   rpc_user_key,
                                   opts.m_credentials.m_user);
        if(err.has_value()) {
            return err.value();
        }

        err = read_required_string(cfg,
                                   rpc_password_key,
                                   opts.m_credentials.m_password);
        if(err.has_value()) {
            return err.value();
        }

        const auto timeout = cfg.get_long(rpc_timeout_key);
        if(timeout.has_value()) {
            const auto as_long = static_cast<long>(timeout.value());
            if(as_long != timeout.value()) {
                return std::string("rpc_timeout out of range");
            }
            opts.m_rpc_timeout = as_long;
        }

        if(cfg.get_string(loglevel_key).has_value()) {
            const auto level = cfg.get_loglevel(loglevel_key);
            if(!level.has_value()) {
                return std::string("Invalid loglevel");
            }
            opts.m_loglevel = level.value();
        }

        return opts;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto cfg = parser(config_file);
        if(!cfg.good()) {
            return "Unable to open config file " + config_file;
        }
        return read_options(cfg);
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_credentials.m_url.empty()) {
            return "rpc_endpoint must not be empty";
        }
        if(opts.m_credentials.m_user.empty()) {
            return "rpc_user must not be empty";
        }
        if(opts.m_rpc_timeout < 0) {
            return "rpc_timeout must not be negative";
        }
        return std::nullopt;
    }
}
