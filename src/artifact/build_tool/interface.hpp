// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ARTIFACT_BUILD_TOOL_INTERFACE_H_
#define CODEPROOF_SRC_ARTIFACT_BUILD_TOOL_INTERFACE_H_

#include "artifact/artifact.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace codeproof::artifact::build_tool {
    /// A build output file that could not be turned into an artifact.
    struct malformed_output {
        contract_id m_contract;
        std::string m_reason;
    };

    /// Everything a successful build produced.
    struct build_output {
        /// One entry per contract. m_profile and m_metadata_length are left
        /// for the caller to fill.
        std::vector<build_artifact> m_contracts;
        /// Output files that were skipped.
        std::vector<malformed_output> m_malformed;
    };

    /// Return type from profiles.
    using profiles_return_type
        = std::variant<std::set<std::string>, build_failure>;
    /// Return type from compile.
    using compile_return_type = std::variant<build_output, build_failure>;

    /// A smart contract build tool operating on a checked-out project.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Lists the build profiles the project defines.
        /// \param dir project root.
        /// \return profile names, or unsupported_project if the directory is
        ///         not a project this tool can build.
        virtual auto profiles(const std::filesystem::path& dir)
            -> profiles_return_type = 0;

        /// Compiles the project.
        /// \param dir project root.
        /// \param profile build profile name.
        /// \return per-contract output, or compilation_failed carrying the
        ///         tool's diagnostics.
        virtual auto compile(const std::filesystem::path& dir,
                             const std::string& profile)
            -> compile_return_type = 0;
    };
}

#endif // CODEPROOF_SRC_ARTIFACT_BUILD_TOOL_INTERFACE_H_
