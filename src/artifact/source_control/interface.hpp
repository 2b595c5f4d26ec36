// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ARTIFACT_SOURCE_CONTROL_INTERFACE_H_
#define CODEPROOF_SRC_ARTIFACT_SOURCE_CONTROL_INTERFACE_H_

#include "artifact/artifact.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace codeproof::artifact::source_control {
    /// Access to a version-controlled source repository.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Clones a repository into a directory that does not yet exist.
        /// \param url repository URL.
        /// \param dir destination directory.
        /// \return std::nullopt on success, or a clone_failed failure.
        virtual auto clone(const std::string& url,
                           const std::filesystem::path& dir)
            -> std::optional<build_failure> = 0;

        /// Checks out a commit in a cloned repository.
        /// \param dir repository directory.
        /// \param commit full commit hash.
        /// \return std::nullopt on success, or a checkout_failed failure.
        virtual auto checkout(const std::filesystem::path& dir,
                              const std::string& commit)
            -> std::optional<build_failure> = 0;
    };
}

#endif // CODEPROOF_SRC_ARTIFACT_SOURCE_CONTROL_INTERFACE_H_
