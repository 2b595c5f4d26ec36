// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

namespace codeproof::chain {
    auto bytes_from_rpc_hex(const std::string& hex) -> std::optional<buffer> {
        if(hex.rfind("0x", 0) != 0) {
            return std::nullopt;
        }
        return buffer::from_hex(hex.substr(2));
    }

    auto quantity_from_hex(const std::string& hex) -> std::optional<uint64_t> {
        static constexpr size_t max_digits = 16;
        if(hex.rfind("0x", 0) != 0 || hex.size() <= 2
           || hex.size() > 2 + max_digits) {
            return std::nullopt;
        }
        uint64_t ret{0};
        static constexpr auto radix = 16;
        for(size_t i = 2; i < hex.size(); i++) {
            auto c = hex[i];
            uint64_t digit{};
            if(c >= '0' && c <= '9') {
                digit = static_cast<uint64_t>(c - '0');
            } else if(c >= 'a' && c <= 'f') {
                digit = static_cast<uint64_t>(c - 'a' + 10);
            } else if(c >= 'A' && c <= 'F') {
                digit = static_cast<uint64_t>(c - 'A' + 10);
            } else {
                return std::nullopt;
            }
            ret = ret * radix + digit;
        }
        return ret;
    }
}
