// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

namespace codeproof::chain {
    auto to_string(chain_error err) -> std::string {
        switch(err) {
            case chain_error::rpc_error:
                return "rpc_error";
            case chain_error::tx_not_found:
                return "tx_not_found";
            case chain_error::tx_pending:
                return "tx_pending";
            case chain_error::cancelled:
                return "cancelled";
        }
        return "unknown";
    }
}
