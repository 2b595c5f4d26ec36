// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_VERIFIER_REQUEST_H_
#define CODEPROOF_SRC_VERIFIER_REQUEST_H_

#include "artifact/builder.hpp"
#include "chain/registry.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codeproof::verifier {
    /// Profile used when a request names none.
    static constexpr auto default_profile = "default";

    /// Where to find a contract's source.
    struct source_spec {
        std::string m_repo_url;
        /// Full 40-character hex commit hash.
        std::string m_commit;
        /// Contract identifier in the form path:Name.
        std::string m_contract;
    };

    /// A verification request as received from a caller.
    struct verification_request {
        /// Source to build. Without it every chain with code is only
        /// decompiled.
        std::optional<source_spec> m_source;
        /// 0x-prefixed 20-byte contract address.
        std::string m_address;
        /// 0x-prefixed 32-byte creation transaction hash.
        std::optional<std::string> m_creation_tx;
        std::string m_profile{default_profile};
        /// Single chain to verify. All configured chains if unset.
        std::optional<chain::chain_id_type> m_chain_id;
    };

    /// Reasons a request is rejected before any work starts.
    enum class request_error : uint8_t {
        /// The source is missing its repository, commit or contract.
        missing_source_field,
        /// The commit is not a 40-character hex hash.
        malformed_commit,
        /// The address is not 0x followed by 40 hex digits.
        malformed_address,
        /// The transaction hash is not 0x followed by 64 hex digits.
        malformed_tx_hash,
        empty_profile,
        /// The requested chain is not configured.
        unsupported_chain,
        /// No chains are configured.
        no_chains
    };

    /// Returns the snake_case name of a request error.
    auto to_string(request_error err) -> std::string;

    /// A request error with a description of the offending field.
    struct request_failure {
        request_error m_code{};
        std::string m_message;
    };

    /// A request whose fields have been parsed and checked.
    struct validated_request {
        /// Build to run, if a source was supplied.
        std::optional<artifact::build_request> m_build;
        evmc::address m_address{};
        std::optional<evmc::bytes32> m_creation_tx;
        /// Chains to verify, ordered by chain ID.
        std::vector<chain::chain_info> m_targets;
    };

    /// Checks a request and resolves its target chains.
    /// \param req request to check.
    /// \param chains configured chains.
    /// \return the validated request, or the first problem found.
    auto validate(const verification_request& req,
                  const chain::registry& chains)
        -> std::variant<validated_request, request_failure>;
}

#endif // CODEPROOF_SRC_VERIFIER_REQUEST_H_
