// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_BITCOIN_ADDRESS_AMOUNTS_H_
#define BTCRPC_SRC_BITCOIN_ADDRESS_AMOUNTS_H_

#include "amount.hpp"

#include <json/json.h>
#include <utility>
#include <vector>

namespace btcrpc::bitcoin {
    /// \brief Payment outputs for calls such as sendmany.
    ///
    /// Holds an ordered list of (address, amount) pairs which the daemon
    /// expects as a JSON object keyed by address rather than as an array.
    /// Encode-only. Duplicate addresses are not checked; the last pair for
    /// an address wins.
    class address_amounts {
      public:
        using pair_type = std::pair<address, amount>;

        address_amounts() = default;

        /// Constructor.
        /// \param pairs outputs in the order given by the caller.
        explicit address_amounts(std::vector<pair_type> pairs);

        /// Appends an output.
        void add(address addr, amount amt);

        /// Returns the outputs in insertion order.
        [[nodiscard]] auto pairs() const -> const std::vector<pair_type>&;

        /// Encodes the outputs as {"<address>": <amount>, ...}.
        [[nodiscard]] auto to_json() const -> Json::Value;

      private:
        std::vector<pair_type> m_pairs;
    };
}

#endif
