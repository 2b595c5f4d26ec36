// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ARTIFACT_SOURCE_CONTROL_GIT_H_
#define CODEPROOF_SRC_ARTIFACT_SOURCE_CONTROL_GIT_H_

#include "interface.hpp"
#include "util/common/logging.hpp"

#include <memory>

namespace codeproof::artifact::source_control {
    /// Source control through the git command-line client.
    class git : public interface {
      public:
        /// Constructor.
        /// \param git_path git executable, looked up on PATH if bare.
        /// \param log log instance.
        git(std::string git_path, std::shared_ptr<logging::log> log);

        /// Runs git clone --quiet url dir.
        auto clone(const std::string& url, const std::filesystem::path& dir)
            -> std::optional<build_failure> override;

        /// Runs git checkout --quiet commit inside dir.
        auto checkout(const std::filesystem::path& dir,
                      const std::string& commit)
            -> std::optional<build_failure> override;

      private:
        std::string m_git_path;
        std::shared_ptr<logging::log> m_log;
    };
}

#endif // CODEPROOF_SRC_ARTIFACT_SOURCE_CONTROL_GIT_H_
