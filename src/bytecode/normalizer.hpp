// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_BYTECODE_NORMALIZER_H_
#define CODEPROOF_SRC_BYTECODE_NORMALIZER_H_

#include "util/common/buffer.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codeproof::bytecode {
    /// Errors raised while normalizing bytecode. Scoped to one chain's match
    /// attempt.
    enum class normalization_error : uint8_t {
        /// An immutable reference extends past the end of the bytecode.
        range_out_of_bounds
    };

    /// Returns the snake_case name of a normalization error.
    auto to_string(normalization_error err) -> std::string;

    /// Byte range of one immutable variable reference in runtime code.
    struct immutable_range {
        size_t m_offset{};
        size_t m_length{};

        auto operator==(const immutable_range& rhs) const -> bool;
    };

    /// Immutable references keyed by the compiler's reference ID.
    using immutable_map = std::map<std::string, std::vector<immutable_range>>;

    /// Bytecode split at the start of the compiler metadata trailer.
    struct split_code {
        /// Everything before the trailer.
        buffer m_core;
        /// The trailer including its 2-byte length suffix. Empty if the
        /// code has no plausible trailer.
        buffer m_trailer;
    };

    /// \brief Splits off the compiler metadata trailer.
    ///
    /// The last two bytes hold the big-endian length L of the CBOR map that
    /// precedes them. The trailer is the final L + 2 bytes. Code of 2 bytes
    /// or less, with L larger than the remaining code, or whose final L
    /// bytes are not exactly one well-formed CBOR map, has no trailer.
    /// Trailers stacked back to back are all split off, so the returned
    /// core never has a trailer of its own.
    /// \param code bytecode to split.
    /// \return core and trailer.
    auto strip_metadata(const buffer& code) -> split_code;

    /// Overwrites every immutable reference range with zeros in a copy of the
    /// code.
    /// \param code runtime bytecode.
    /// \param immutables reference ranges within code.
    /// \return masked copy, or range_out_of_bounds if any range does not fit.
    auto mask_immutables(const buffer& code, const immutable_map& immutables)
        -> std::variant<buffer, normalization_error>;

    /// Creation transaction input divided at the end of the compiled code.
    struct split_input {
        /// The first compiled_len bytes.
        buffer m_code;
        /// ABI-encoded constructor arguments following the code.
        buffer m_args;
    };

    /// Splits a creation transaction input into code and constructor
    /// arguments.
    /// \param input on-chain creation input.
    /// \param compiled_len length of the compiled creation code.
    /// \return split input, or std::nullopt if input is shorter than
    ///         compiled_len.
    auto split_constructor_args(const buffer& input, size_t compiled_len)
        -> std::optional<split_input>;
}

#endif // CODEPROOF_SRC_BYTECODE_NORMALIZER_H_
