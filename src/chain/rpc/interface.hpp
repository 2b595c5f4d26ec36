// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_CHAIN_RPC_INTERFACE_H_
#define CODEPROOF_SRC_CHAIN_RPC_INTERFACE_H_

#include "chain/messages.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <variant>

namespace codeproof::chain::rpc {
    /// Read access to one chain's state. Calls block the calling thread and
    /// report failures as values. A single attempt is made per call; retries
    /// are the caller's concern.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Return type from get_code. The deployed code, empty when no
        /// contract exists at the address, or a failure.
        using code_return_type = std::variant<buffer, rpc_failure>;

        /// Return type from get_transaction. std::nullopt when the node
        /// reports no such transaction.
        using transaction_return_type
            = std::variant<std::optional<transaction>, rpc_failure>;

        /// Fetches the code deployed at an address at the latest block.
        /// \param addr contract address.
        /// \return deployed code or failure.
        virtual auto get_code(const evmc::address& addr)
            -> code_return_type = 0;

        /// Fetches a transaction by hash.
        /// \param tx_hash transaction hash.
        /// \return transaction, std::nullopt if unknown, or failure.
        virtual auto get_transaction(const evmc::bytes32& tx_hash)
            -> transaction_return_type = 0;
    };
}

#endif // CODEPROOF_SRC_CHAIN_RPC_INTERFACE_H_
