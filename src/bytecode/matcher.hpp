// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_BYTECODE_MATCHER_H_
#define CODEPROOF_SRC_BYTECODE_MATCHER_H_

#include "abi.hpp"
#include "normalizer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace codeproof::bytecode {
    /// Outcome of comparing compiled and on-chain bytecode.
    enum class match_verdict : uint8_t {
        /// Byte-identical after normalization.
        exact_match,
        /// Identical once the metadata trailer is ignored.
        partial_match,
        /// Normalized code differs.
        no_match,
        /// No on-chain code to compare against.
        absent
    };

    /// Returns the snake_case name of a verdict.
    auto to_string(match_verdict verdict) -> std::string;

    /// Verdict with the diagnostic that explains a no_match, if any.
    struct match_outcome {
        match_verdict m_verdict{match_verdict::absent};
        std::optional<std::string> m_reason;
    };

    /// \brief Compares compiled runtime code against deployed code.
    ///
    /// Rules, first satisfied wins: empty on-chain code is absent; identical
    /// buffers are an exact match; equal cores after stripping both metadata
    /// trailers are a partial match; after masking immutable references on
    /// both sides, identical buffers are an exact match and equal cores a
    /// partial match; anything else is no match.
    /// \param compiled runtime code from the build artifact.
    /// \param onchain code deployed at the address.
    /// \param immutables immutable reference ranges of the compiled code.
    /// \return verdict, with a reason when masking failed.
    auto match_runtime(const buffer& compiled,
                       const buffer& onchain,
                       const immutable_map& immutables) -> match_outcome;

    /// \brief Compares compiled creation code against a creation transaction
    /// input.
    ///
    /// Rules, first satisfied wins: empty input is absent; identical buffers
    /// are an exact match; an input starting with the compiled code is an
    /// exact match; an input starting with the compiled core (metadata
    /// trailer removed) followed by a trailer-sized region is a partial
    /// match; anything else is no match. The bytes after the code must be
    /// well-formed constructor arguments, otherwise the verdict is no match.
    /// \param compiled creation code from the build artifact.
    /// \param onchain_input creation transaction input.
    /// \param ctor_params constructor parameters, if known.
    /// \return verdict, with a reason for malformed constructor arguments.
    auto match_creation(const buffer& compiled,
                        const buffer& onchain_input,
                        const std::optional<std::vector<abi_param>>&
                            ctor_params
                        = std::nullopt) -> match_outcome;
}

#endif // CODEPROOF_SRC_BYTECODE_MATCHER_H_
