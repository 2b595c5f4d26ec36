// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_CHAIN_MESSAGES_H_
#define CODEPROOF_SRC_CHAIN_MESSAGES_H_

#include "util/common/buffer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace codeproof::chain {
    /// Type for an EIP-155 chain ID.
    using chain_id_type = uint64_t;

    /// Errors scoped to a single chain. Recorded in that chain's result and
    /// never escalated to the whole request.
    enum class chain_error : uint8_t {
        /// Transport failure, timeout or malformed response after all
        /// retries were used.
        rpc_error,
        /// The node has no transaction with the given hash.
        tx_not_found,
        /// The transaction exists but is not yet included in a block.
        tx_pending,
        /// The request deadline passed before the chain finished.
        cancelled
    };

    /// Returns the snake_case name of a chain error.
    auto to_string(chain_error err) -> std::string;

    /// A chain error with its diagnostic text.
    struct chain_failure {
        chain_error m_code{};
        std::string m_message;
    };

    /// No code is deployed at the address on this chain.
    struct code_absent {};

    /// Code deployed at the address.
    struct code_present {
        buffer m_code;
    };

    /// Deployed code lookup outcome.
    using deployed_code
        = std::variant<code_absent, code_present, chain_failure>;

    /// A mined contract creation transaction.
    struct creation_tx {
        /// Creation code followed by the constructor arguments.
        buffer m_input;
        /// Number of the block that included the transaction.
        uint64_t m_block{};
    };

    /// Creation transaction lookup outcome.
    using creation_input = std::variant<creation_tx, chain_failure>;

    /// Everything fetched from one chain for one request.
    struct on_chain_data {
        chain_id_type m_chain_id{};
        deployed_code m_code{code_absent{}};
        /// Absent when no creation transaction hash was supplied.
        std::optional<creation_input> m_creation_input;
    };

    /// Transient failure reported by a chain RPC implementation.
    struct rpc_failure {
        std::string m_message;
    };

    /// Subset of an eth_getTransactionByHash response.
    struct transaction {
        /// Call data of the transaction. For a contract creation, the
        /// creation code followed by the constructor arguments.
        buffer m_input;
        /// Block number, or std::nullopt while the transaction is pending.
        std::optional<uint64_t> m_block;
    };
}

#endif // CODEPROOF_SRC_CHAIN_MESSAGES_H_
