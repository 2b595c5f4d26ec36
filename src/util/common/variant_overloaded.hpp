// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_COMMON_VARIANT_OVERLOADED_H_
#define CODEPROOF_SRC_COMMON_VARIANT_OVERLOADED_H_

namespace codeproof {
    /// \brief Variant handler template
    ///
    /// Provides template structure for defining handlers for std::variant
    /// types in an std::visit function.
    ///
    /// Example:
    /// \code{.cpp}
    ///      std::variant<code_absent, code_present> code = ...;
    ///      std::visit(overloaded{
    ///                     [&](const code_absent&) {...},
    ///                     [&](const code_present&) {...}
    ///                 },
    ///                 code);
    /// \endcode
    ///
    /// \tparam Ts lambda overloads
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

#endif // CODEPROOF_SRC_COMMON_VARIANT_OVERLOADED_H_
