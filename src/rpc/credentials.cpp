// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "credentials.hpp"

namespace btcrpc::rpc {
    auto credentials::operator==(const credentials& rhs) const -> bool {
        return m_url == rhs.m_url && m_user == rhs.m_user
            && m_password == rhs.m_password;
    }
}
