// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/buffer.hpp"

#include <cstring>
#include <gtest/gtest.h>

TEST(buffer_test, to_from_hex) {
    std::string data = "hello";

    auto buf = codeproof::buffer();
    buf.extend(data.size());
    std::memcpy(buf.data(), data.data(), data.size());
    auto hex = buf.to_hex();
    ASSERT_EQ(hex, "68656c6c6f");

    auto from = codeproof::buffer::from_hex(hex);
    ASSERT_EQ(from.value(), buf);
}

TEST(buffer_test, from_hex_upper_case) {
    auto from = codeproof::buffer::from_hex("ABcd");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->to_hex(), "abcd");
}

TEST(buffer_test, from_hex_invalid_char) {
    auto from = codeproof::buffer::from_hex("ZZ11ff");
    ASSERT_FALSE(from.has_value());
}

TEST(buffer_test, from_hex_invalid_len) {
    auto from = codeproof::buffer::from_hex("11ffa");
    ASSERT_FALSE(from.has_value());
}

TEST(buffer_test, from_hex_empty) {
    auto from = codeproof::buffer::from_hex("");
    ASSERT_TRUE(from.has_value());
    ASSERT_TRUE(from->empty());
}

TEST(buffer_test, from_hex_prefixed) {
    auto from = codeproof::buffer::from_hex_prefixed("0x0102");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->size(), 2);
    ASSERT_EQ(from->to_hex_prefixed(), "0x0102");

    auto odd = codeproof::buffer::from_hex_prefixed("0x102");
    ASSERT_TRUE(odd.has_value());
    ASSERT_EQ(odd->to_hex(), "0102");

    auto bare = codeproof::buffer::from_hex_prefixed("ff");
    ASSERT_TRUE(bare.has_value());
    ASSERT_EQ(bare->byte_at(0), 0xff);

    auto empty = codeproof::buffer::from_hex_prefixed("0x");
    ASSERT_TRUE(empty.has_value());
    ASSERT_TRUE(empty->empty());
}

TEST(buffer_test, slice_clamps) {
    auto buf = codeproof::buffer::from_hex("0102030405").value();
    ASSERT_EQ(buf.slice(1, 2).to_hex(), "0203");
    ASSERT_EQ(buf.slice(3, 10).to_hex(), "0405");
    ASSERT_TRUE(buf.slice(7, 1).empty());
    ASSERT_EQ(buf.slice_from(4).to_hex(), "05");
    ASSERT_TRUE(buf.slice_from(5).empty());
}

TEST(buffer_test, zero_and_truncate) {
    auto buf = codeproof::buffer::from_hex("ffffffff").value();
    buf.zero(1, 2);
    ASSERT_EQ(buf.to_hex(), "ff0000ff");
    buf.truncate(2);
    ASSERT_EQ(buf.to_hex(), "ff00");
    buf.truncate(5);
    ASSERT_EQ(buf.size(), 2);
}
