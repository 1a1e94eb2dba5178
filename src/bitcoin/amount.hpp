// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_BITCOIN_AMOUNT_H_
#define BTCRPC_SRC_BITCOIN_AMOUNT_H_

#include <cstdint>
#include <json/json.h>
#include <optional>
#include <string>

namespace btcrpc::bitcoin {
    /// Base58 or bech32 encoded address, passed through as an opaque string.
    using address = std::string;

    /// Number of satoshis in one coin.
    static constexpr int64_t coin = 100000000;

    /// \brief Fixed-point coin quantity with satoshi resolution.
    ///
    /// The daemon exchanges amounts as JSON numbers in coin units with up
    /// to 8 fractional digits. Internally the value is an exact satoshi
    /// count.
    class amount {
      public:
        amount() = default;

        /// Constructs an amount from a satoshi count.
        explicit constexpr amount(int64_t satoshis) : m_satoshis(satoshis) {}

        /// Constructs an amount from a value in coin units, rounded to the
        /// nearest satoshi.
        /// \return the amount, or std::nullopt if coins is not finite or
        ///         out of range.
        static auto from_coins(double coins) -> std::optional<amount>;

        /// Decodes a JSON number in coin units.
        /// \return the amount, or std::nullopt if val is not a number in
        ///         range.
        static auto from_json(const Json::Value& val)
            -> std::optional<amount>;

        /// Encodes the amount as a JSON number in coin units.
        [[nodiscard]] auto to_json() const -> Json::Value;

        [[nodiscard]] constexpr auto satoshis() const -> int64_t {
            return m_satoshis;
        }

        /// Value in coin units. May lose precision above 2^53 satoshis.
        [[nodiscard]] auto coins() const -> double;

        /// Formats the amount with exactly 8 fractional digits, e.g.
        /// "-0.00012000".
        [[nodiscard]] auto to_string() const -> std::string;

        auto operator==(const amount& rhs) const -> bool;
        auto operator!=(const amount& rhs) const -> bool;
        auto operator<(const amount& rhs) const -> bool;

      private:
        int64_t m_satoshis{};
    };
}

#endif
