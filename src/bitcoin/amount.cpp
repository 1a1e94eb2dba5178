// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace btcrpc::bitcoin {
    auto amount::from_coins(double coins) -> std::optional<amount> {
        if(!std::isfinite(coins)) {
            return std::nullopt;
        }
        const auto sats = std::round(coins * static_cast<double>(coin));
        // 2^63 is exactly representable; anything at or past it overflows.
        static constexpr double limit = 9223372036854775808.0;
        if(sats >= limit || sats < -limit) {
            return std::nullopt;
        }
        return amount(static_cast<int64_t>(sats));
    }

    auto amount::from_json(const Json::Value& val) -> std::optional<amount> {
        if(!val.isNumeric()) {
            return std::nullopt;
        }
        if(val.isInt64()) {
            static constexpr auto max_coins
                = std::numeric_limits<int64_t>::max() / coin;
            const auto whole = val.asInt64();
            if(whole <= max_coins && whole >= -max_coins) {
                return amount(whole * coin);
            }
        }
        return from_coins(val.asDouble());
    }

    auto amount::to_json() const -> Json::Value {
        return Json::Value(coins());
    }

    auto amount::coins() const -> double {
        return static_cast<double>(m_satoshis) / static_cast<double>(coin);
    }

    auto amount::to_string() const -> std::string {
        const auto negative = m_satoshis < 0;
        // Unsigned negation keeps INT64_MIN well defined.
        const auto abs_sats = negative ? 0 - static_cast<uint64_t>(m_satoshis)
                                       : static_cast<uint64_t>(m_satoshis);
        const auto ucoin = static_cast<uint64_t>(coin);

        std::stringstream ss;
        if(negative) {
            ss << "-";
        }
        ss << abs_sats / ucoin << "." << std::setfill('0') << std::setw(8)
           << abs_sats % ucoin;
        return ss.str();
    }

    auto amount::operator==(const amount& rhs) const -> bool {
        return m_satoshis == rhs.m_satoshis;
    }

    auto amount::operator!=(const amount& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto amount::operator<(const amount& rhs) const -> bool {
        return m_satoshis < rhs.m_satoshis;
    }
}
