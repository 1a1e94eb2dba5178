// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "address_amounts.hpp"

namespace btcrpc::bitcoin {
    address_amounts::address_amounts(std::vector<pair_type> pairs)
        : m_pairs(std::move(pairs)) {}

    void address_amounts::add(address addr, amount amt) {
        m_pairs.emplace_back(std::move(addr), amt);
    }

    auto address_amounts::pairs() const -> const std::vector<pair_type>& {
        return m_pairs;
    }

    auto address_amounts::to_json() const -> Json::Value {
        auto obj = Json::Value(Json::objectValue);
        for(const auto& [addr, amt] : m_pairs) {
            obj[addr] = amt.to_json();
        }
        return obj;
    }
}
