// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file pipeline.hpp
 * Per-chain verification pipeline: fetch on-chain data, match it against
 * the build artifact, then decompile when nothing matched.
 */

#ifndef CODEPROOF_SRC_ORCHESTRATOR_PIPELINE_H_
#define CODEPROOF_SRC_ORCHESTRATOR_PIPELINE_H_

#include "artifact/artifact.hpp"
#include "bytecode/matcher.hpp"
#include "chain/fetcher.hpp"
#include "chain/registry.hpp"
#include "decompiler/interface.hpp"
#include "util/common/hash.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <optional>

namespace codeproof::orchestrator {
    /// Outcome of verifying one chain.
    struct chain_verification_result {
        chain::chain_id_type m_chain_id{};
        std::string m_chain_name;
        bytecode::match_verdict m_creation{bytecode::match_verdict::absent};
        bytecode::match_verdict m_runtime{bytecode::match_verdict::absent};
        /// Why a comparison failed, when a specific cause is known.
        std::optional<std::string> m_reason;
        /// Chain error that prevented fetching some of the data.
        std::optional<chain::chain_failure> m_error;
        /// Block that included the creation transaction, when it was
        /// fetched.
        std::optional<uint64_t> m_creation_block;
        /// Keccak-256 hash of the deployed code, when code exists.
        std::optional<hash_t> m_code_hash;
        std::optional<decompiler::decompilation> m_decompilation;
    };

    /// Returns true if the decompilation stage should run: code exists and
    /// neither verdict is a match.
    /// \param creation creation code verdict.
    /// \param runtime runtime code verdict.
    /// \param has_code true if the chain has code at the address.
    auto should_decompile(bytecode::match_verdict creation,
                          bytecode::match_verdict runtime,
                          bool has_code) -> bool;

    /// Fetches everything one chain has for a request. The creation
    /// transaction is only fetched when code exists at the address.
    /// \param chain_id chain being fetched.
    /// \param fetcher fetcher bound to the chain.
    /// \param addr contract address.
    /// \param tx_hash creation transaction hash, if supplied.
    /// \return on-chain data.
    auto fetch_chain(chain::chain_id_type chain_id,
                     chain::fetcher& fetcher,
                     const evmc::address& addr,
                     const std::optional<evmc::bytes32>& tx_hash)
        -> chain::on_chain_data;

    /// Matches on-chain data against an artifact. Without an artifact, a
    /// chain with code gets no_match verdicts.
    /// \param data fetched on-chain data.
    /// \param art build artifact, or nullptr if no source was supplied.
    /// \return result with verdicts, reason, error and code hash set.
    auto match_chain(const chain::on_chain_data& data,
                     const artifact::build_artifact* art)
        -> chain_verification_result;

    /// Runs fetch, match and, when should_decompile holds, decompilation
    /// for one chain. Never fails: errors are recorded in the result.
    /// \param chain chain to verify.
    /// \param fetcher fetcher bound to the chain.
    /// \param addr contract address.
    /// \param tx_hash creation transaction hash, if supplied.
    /// \param art build artifact, or nullptr.
    /// \param decompiler decompiler for the fallback stage.
    /// \param log log instance.
    /// \return the chain's result.
    auto run_chain(const chain::chain_info& chain,
                   chain::fetcher& fetcher,
                   const evmc::address& addr,
                   const std::optional<evmc::bytes32>& tx_hash,
                   const artifact::build_artifact* art,
                   decompiler::interface& decompiler,
                   logging::log& log) -> chain_verification_result;
}

#endif // CODEPROOF_SRC_ORCHESTRATOR_PIPELINE_H_
