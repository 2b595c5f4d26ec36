// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_VERIFIER_RESULT_H_
#define CODEPROOF_SRC_VERIFIER_RESULT_H_

#include "orchestrator/pipeline.hpp"
#include "request.hpp"

#include <json/json.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codeproof::verifier {
    /// What was built for a request.
    struct artifact_summary {
        artifact::contract_id m_contract;
        std::string m_compiler_version;
        std::string m_language;
        /// Compiler settings, or null if the build output had none.
        Json::Value m_settings;
        std::string m_profile;
        Json::Value m_abi{Json::arrayValue};
        size_t m_metadata_length{};
    };

    /// Outcome of a request that passed validation and built.
    struct verification_result {
        verification_request m_request;
        /// Set when a source was supplied and built.
        std::optional<artifact_summary> m_artifact;
        /// One entry per requested chain, ordered by chain ID.
        std::vector<orchestrator::chain_verification_result> m_chains;
    };

    /// Request-level failure. No chain work was done.
    using verification_error
        = std::variant<request_failure, artifact::build_failure>;

    /// Assembles the final result. Every target gets exactly one entry:
    /// duplicates keep the first, entries for chains that were not targeted
    /// are dropped and missing targets are recorded as cancelled.
    /// \param req the request being answered.
    /// \param targets requested chains.
    /// \param art build artifact, or nullptr.
    /// \param results per-chain results from the orchestrator.
    /// \return assembled result, ordered by chain ID.
    auto assemble(const verification_request& req,
                  const std::vector<chain::chain_info>& targets,
                  const artifact::build_artifact* art,
                  std::vector<orchestrator::chain_verification_result> results)
        -> verification_result;

    /// Serializes a result. Object keys are sorted and bytes are 0x hex.
    auto to_json(const verification_result& res) -> Json::Value;

    /// Serializes a request-level error as {"error": {...}}.
    auto to_json(const verification_error& err) -> Json::Value;

    /// Serializes a single chain result.
    auto to_json(const orchestrator::chain_verification_result& res)
        -> Json::Value;

    /// Writes JSON as indented text, byte-identical for equal values.
    auto to_string(const Json::Value& json) -> std::string;
}

#endif // CODEPROOF_SRC_VERIFIER_RESULT_H_
