// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

#include <sstream>

namespace btcrpc::rpc {
    auto api_error::operator==(const api_error& rhs) const -> bool {
        return m_code == rhs.m_code && m_message == rhs.m_message;
    }

    auto result_type_error::operator==(const result_type_error& rhs) const
        -> bool {
        return m_raw == rhs.m_raw;
    }

    auto transport_error::operator==(const transport_error& rhs) const
        -> bool {
        return m_message == rhs.m_message;
    }

    auto to_string(const call_error& err) -> std::string {
        std::stringstream ss;
        if(const auto* api = std::get_if<api_error>(&err)) {
            ss << "API error " << api->m_code << ": " << api->m_message;
        } else if(const auto* rte = std::get_if<result_type_error>(&err)) {
            ss << "Result type error (" << rte->m_raw.size()
               << " bytes): " << rte->m_raw;
        } else if(const auto* te = std::get_if<transport_error>(&err)) {
            ss << "Transport error: " << te->m_message;
        }
        return ss.str();
    }
}
