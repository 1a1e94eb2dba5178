// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "bitcoin/amount.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using btcrpc::bitcoin::amount;

TEST(amount_test, from_coins_rounds_to_satoshi) {
    ASSERT_EQ(amount::from_coins(1.5), amount(150000000));
    ASSERT_EQ(amount::from_coins(0.1), amount(10000000));
    ASSERT_EQ(amount::from_coins(0.000000014), amount(1));
    ASSERT_EQ(amount::from_coins(-0.00000001), amount(-1));
    ASSERT_EQ(amount::from_coins(21000000.0),
              amount(21000000 * btcrpc::bitcoin::coin));
}

TEST(amount_test, from_coins_rejects_non_finite) {
    ASSERT_FALSE(amount::from_coins(std::nan("")).has_value());
    ASSERT_FALSE(amount::from_coins(std::numeric_limits<double>::infinity())
                     .has_value());
    ASSERT_FALSE(amount::from_coins(1e12).has_value());
}

TEST(amount_test, from_json) {
    ASSERT_EQ(amount::from_json(Json::Value(0.5)), amount(50000000));
    ASSERT_EQ(amount::from_json(Json::Value(3)), amount(300000000));
    ASSERT_EQ(amount::from_json(Json::Value(-0.0001)), amount(-10000));
    ASSERT_FALSE(amount::from_json(Json::Value("0.5")).has_value());
    ASSERT_FALSE(amount::from_json(Json::Value(Json::nullValue)).has_value());
    ASSERT_FALSE(amount::from_json(Json::Value(true)).has_value());
}

TEST(amount_test, to_json) {
    auto val = amount(123456789).to_json();
    ASSERT_TRUE(val.isDouble());
    ASSERT_DOUBLE_EQ(val.asDouble(), 1.23456789);
    ASSERT_EQ(amount::from_json(val), amount(123456789));
}

TEST(amount_test, to_string) {
    ASSERT_EQ(amount(0).to_string(), "0.00000000");
    ASSERT_EQ(amount(150000000).to_string(), "1.50000000");
    ASSERT_EQ(amount(-12000).to_string(), "-0.00012000");
    ASSERT_EQ(amount(std::numeric_limits<int64_t>::min()).to_string(),
              "-92233720368.54775808");
}

TEST(amount_test, comparison) {
    ASSERT_TRUE(amount(1) < amount(2));
    ASSERT_FALSE(amount(2) < amount(2));
    ASSERT_NE(amount(1), amount(2));
    ASSERT_EQ(amount().satoshis(), 0);
}
