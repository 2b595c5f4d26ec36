// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_DECOMPILER_SELECTOR_SCAN_H_
#define CODEPROOF_SRC_DECOMPILER_SELECTOR_SCAN_H_

#include "bytecode/abi.hpp"
#include "interface.hpp"

#include <vector>

namespace codeproof::decompiler {
    /// \brief Returns the selectors compared by a contract's function
    ///        dispatcher.
    ///
    /// Walks the instructions, skipping PUSH immediates, and collects every
    /// PUSH4 operand that is compared with EQ within the next two
    /// instructions. The metadata trailer is not scanned.
    /// \param code runtime bytecode.
    /// \return distinct selectors in ascending order.
    auto scan_selectors(const buffer& code)
        -> std::vector<bytecode::selector_t>;

    /// In-process decompiler recovering the dispatcher's function table.
    class selector_scan : public interface {
      public:
        /// Emits one ABI function per dispatched selector, named from
        /// known_abi where a signature hashes to the selector.
        auto decompile(const buffer& code, const Json::Value& known_abi)
            -> std::optional<decompilation> override;
    };
}

#endif // CODEPROOF_SRC_DECOMPILER_SELECTOR_SCAN_H_
