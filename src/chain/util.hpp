// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_CHAIN_UTIL_H_
#define CODEPROOF_SRC_CHAIN_UTIL_H_

#include "util/common/buffer.hpp"

#include <cstring>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <optional>
#include <string>
#include <type_traits>

namespace codeproof::chain {
    /// Converts a bytes-like object to a hex string.
    /// \tparam T type to convert from.
    /// \param v value to convert.
    /// \return hex string representation of v, without prefix.
    template<typename T>
    auto to_hex(const T& v) -> std::string {
        return evmc::hex(evmc::bytes(v.bytes, sizeof(v.bytes)));
    }

    /// Parses a strictly formatted, 0x-prefixed hex string of exactly
    /// sizeof(T) bytes.
    /// \tparam T evmc::address or evmc::bytes32.
    /// \param hex hex string to parse. Must start with 0x.
    /// \return the parsed value or std::nullopt if the string is not 0x
    ///         followed by 2 * sizeof(T) hex digits.
    template<typename T>
    auto from_hex(const std::string& hex) ->
        typename std::enable_if_t<std::is_same<T, evmc::bytes32>::value
                                      || std::is_same<T, evmc::address>::value,
                                  std::optional<T>> {
        constexpr auto prefix_len = 2;
        if(hex.size() != prefix_len + 2 * sizeof(T)
           || hex.rfind("0x", 0) != 0) {
            return std::nullopt;
        }
        auto maybe_bytes = buffer::from_hex(hex.substr(prefix_len));
        if(!maybe_bytes.has_value()) {
            return std::nullopt;
        }

        auto val = T();
        std::memcpy(val.bytes,
                    maybe_bytes.value().data(),
                    maybe_bytes.value().size());
        return val;
    }

    /// Parses a 0x-prefixed hex byte string as returned by JSON-RPC nodes.
    /// \param hex hex string. "0x" yields an empty buffer.
    /// \return parsed bytes, or std::nullopt if the prefix is missing or the
    ///         digits are not valid hex.
    auto bytes_from_rpc_hex(const std::string& hex) -> std::optional<buffer>;

    /// Parses a 0x-prefixed hex quantity, as used for block numbers.
    /// \param hex quantity string, such as 0x1b4.
    /// \return value, or std::nullopt if malformed or wider than 64 bits.
    auto quantity_from_hex(const std::string& hex) -> std::optional<uint64_t>;
}

#endif // CODEPROOF_SRC_CHAIN_UTIL_H_
