// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_DECOMPILER_INTERFACE_H_
#define CODEPROOF_SRC_DECOMPILER_INTERFACE_H_

#include "util/common/buffer.hpp"

#include <json/json.h>
#include <optional>
#include <string>

namespace codeproof::decompiler {
    /// Best-effort reconstruction of a contract from its bytecode.
    struct decompilation {
        /// Recovered ABI. Function names may be placeholders.
        Json::Value m_abi{Json::arrayValue};
        /// Solidity-like pseudo-source.
        std::string m_pseudo_source;
    };

    /// Recovers an approximate ABI and pseudo-source from runtime bytecode.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Decompiles runtime bytecode. Must not throw.
        /// \param code on-chain runtime bytecode.
        /// \param known_abi ABI used to name recovered functions, or null.
        /// \return decompilation, or std::nullopt if nothing could be
        ///         recovered.
        virtual auto decompile(const buffer& code, const Json::Value& known_abi)
            -> std::optional<decompilation> = 0;
    };
}

#endif // CODEPROOF_SRC_DECOMPILER_INTERFACE_H_
