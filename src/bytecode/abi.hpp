// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_BYTECODE_ABI_H_
#define CODEPROOF_SRC_BYTECODE_ABI_H_

#include "util/common/buffer.hpp"

#include <array>
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codeproof::bytecode {
    /// Size of an ABI word in bytes.
    static constexpr size_t abi_word_size = 32;

    /// One parameter of an ABI function or constructor.
    struct abi_param {
        /// Solidity ABI type, such as uint256, bytes32[] or tuple[2].
        std::string m_type;
        /// Members when m_type is a tuple or an array of tuples.
        std::vector<abi_param> m_components;
    };

    /// Four-byte function selector.
    using selector_t = std::array<uint8_t, 4>;

    /// Parses the "inputs" array of an ABI entry.
    /// \param inputs JSON array of parameter objects.
    /// \return parameters, or std::nullopt if the JSON is not a parameter
    ///         list.
    auto parse_params(const Json::Value& inputs)
        -> std::optional<std::vector<abi_param>>;

    /// Extracts the constructor parameters from a contract ABI.
    /// \param abi full contract ABI.
    /// \return constructor parameters, empty if the ABI has no constructor,
    ///         or std::nullopt if the ABI is not an array.
    auto constructor_inputs(const Json::Value& abi)
        -> std::optional<std::vector<abi_param>>;

    /// Returns the canonical type string used in signatures, expanding
    /// tuples to their component lists.
    auto canonical_type(const abi_param& param) -> std::string;

    /// Returns the canonical signature of an ABI function entry, such as
    /// transfer(address,uint256).
    /// \param entry ABI function object.
    /// \return signature, or std::nullopt if the entry is not a well formed
    ///         function.
    auto function_signature(const Json::Value& entry)
        -> std::optional<std::string>;

    /// Computes the selector of a canonical signature: the first four bytes
    /// of its Keccak-256 hash.
    auto function_selector(const std::string& signature) -> selector_t;

    /// Maps each function in an ABI to its selector.
    /// \param abi full contract ABI.
    /// \return ABI function entries keyed by selector.
    auto functions_by_selector(const Json::Value& abi)
        -> std::map<selector_t, Json::Value>;

    /// Formats a selector as 0x-prefixed hex.
    auto to_string(const selector_t& selector) -> std::string;

    /// \brief Checks that constructor arguments are well-formed ABI encoding.
    ///
    /// Only the structure is checked, never the values. With parameter types,
    /// each static word must be a valid encoding of its type and every
    /// dynamic offset and length must stay inside the buffer. Without types
    /// the buffer must hold a whole number of words.
    /// \param args encoded constructor arguments.
    /// \param params constructor parameters, if known.
    /// \return std::nullopt if well-formed, otherwise a description of the
    ///         first problem found.
    auto validate_abi_encoding(const buffer& args,
                               const std::optional<std::vector<abi_param>>&
                                   params) -> std::optional<std::string>;
}

#endif // CODEPROOF_SRC_BYTECODE_ABI_H_
