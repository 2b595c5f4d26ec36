// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "matcher.hpp"

#include <cstring>

namespace codeproof::bytecode {
    namespace {
        auto starts_with(const buffer& buf, const buffer& prefix) -> bool {
            return buf.size() >= prefix.size()
                && (prefix.empty()
                    || std::memcmp(buf.data(), prefix.data(), prefix.size())
                           == 0);
        }

        /// Accepts the verdict if the constructor arguments are well-formed.
        auto with_args(match_verdict verdict,
                       const buffer& args,
                       const std::optional<std::vector<abi_param>>& params)
            -> match_outcome {
            auto err = validate_abi_encoding(args, params);
            if(err.has_value()) {
                return {match_verdict::no_match, std::move(err)};
            }
            return {verdict, std::nullopt};
        }
    }

    auto to_string(match_verdict verdict) -> std::string {
        switch(verdict) {
            case match_verdict::exact_match:
                return "exact_match";
            case match_verdict::partial_match:
                return "partial_match";
            case match_verdict::no_match:
                return "no_match";
            case match_verdict::absent:
                return "absent";
        }
        return "unknown";
    }

    auto match_runtime(const buffer& compiled,
                       const buffer& onchain,
                       const immutable_map& immutables) -> match_outcome {
        if(onchain.empty()) {
            return {match_verdict::absent, std::nullopt};
        }
        if(compiled == onchain) {
            return {match_verdict::exact_match, std::nullopt};
        }

        auto compiled_split = strip_metadata(compiled);
        auto onchain_split = strip_metadata(onchain);
        if(compiled_split.m_core == onchain_split.m_core) {
            // Full buffers differ, so the trailers must.
            return {match_verdict::partial_match, std::nullopt};
        }

        if(immutables.empty()) {
            return {match_verdict::no_match, std::nullopt};
        }

        auto masked_compiled = mask_immutables(compiled, immutables);
        if(std::holds_alternative<normalization_error>(masked_compiled)) {
            return {match_verdict::no_match,
                    "immutable references do not fit compiled code: "
                        + to_string(std::get<normalization_error>(
                            masked_compiled))};
        }
        auto masked_onchain = mask_immutables(onchain, immutables);
        if(std::holds_alternative<normalization_error>(masked_onchain)) {
            return {match_verdict::no_match,
                    "immutable references do not fit on-chain code: "
                        + to_string(
                            std::get<normalization_error>(masked_onchain))};
        }

        const auto& mc = std::get<buffer>(masked_compiled);
        const auto& mo = std::get<buffer>(masked_onchain);
        if(mc == mo) {
            return {match_verdict::exact_match, std::nullopt};
        }
        if(strip_metadata(mc).m_core == strip_metadata(mo).m_core) {
            return {match_verdict::partial_match, std::nullopt};
        }
        return {match_verdict::no_match, std::nullopt};
    }

    auto match_creation(const buffer& compiled,
                        const buffer& onchain_input,
                        const std::optional<std::vector<abi_param>>&
                            ctor_params) -> match_outcome {
        if(onchain_input.empty()) {
            return {match_verdict::absent, std::nullopt};
        }
        if(compiled == onchain_input) {
            return {match_verdict::exact_match, std::nullopt};
        }

        if(starts_with(onchain_input, compiled)) {
            auto split = split_constructor_args(onchain_input, compiled.size());
            return with_args(match_verdict::exact_match,
                             split->m_args,
                             ctor_params);
        }

        auto compiled_split = strip_metadata(compiled);
        if(!compiled_split.m_trailer.empty()
           && starts_with(onchain_input, compiled_split.m_core)) {
            auto code_len = compiled_split.m_core.size()
                          + compiled_split.m_trailer.size();
            auto split = split_constructor_args(onchain_input, code_len);
            if(split.has_value()) {
                return with_args(match_verdict::partial_match,
                                 split->m_args,
                                 ctor_params);
            }
        }

        return {match_verdict::no_match, std::nullopt};
    }
}
