// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_RPC_CREDENTIALS_H_
#define BTCRPC_SRC_RPC_CREDENTIALS_H_

#include <string>

namespace btcrpc::rpc {
    /// Authentication details for a daemon's JSON-RPC endpoint. Passed by
    /// value or const reference; never modified after construction.
    struct credentials {
        /// Endpoint URL, e.g. http://127.0.0.1:8332.
        std::string m_url;
        /// HTTP Basic username.
        std::string m_user;
        /// HTTP Basic password.
        std::string m_password;

        auto operator==(const credentials& rhs) const -> bool;
    };
}

#endif
