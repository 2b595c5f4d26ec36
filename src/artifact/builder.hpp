// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ARTIFACT_BUILDER_H_
#define CODEPROOF_SRC_ARTIFACT_BUILDER_H_

#include "build_tool/interface.hpp"
#include "source_control/interface.hpp"
#include "util/common/logging.hpp"

#include <memory>

namespace codeproof::artifact {
    /// Source to build for one verification request.
    struct build_request {
        std::string m_repo_url;
        /// Full 40-character commit hash.
        std::string m_commit;
        contract_id m_contract;
        std::string m_profile;
    };

    /// Return type from builder::build.
    using build_return_type
        = std::variant<std::shared_ptr<const build_artifact>, build_failure>;

    /// Builds the artifact of one contract from a repository at a commit.
    /// Every build runs in its own working directory, removed when the build
    /// returns.
    class builder {
      public:
        /// Constructor.
        /// \param work_root parent of the per-build working directories.
        ///                  Empty selects the system temporary directory.
        /// \param source_control repository access.
        /// \param build_tool project build tool.
        /// \param log log instance.
        builder(std::string work_root,
                std::shared_ptr<source_control::interface> source_control,
                std::shared_ptr<build_tool::interface> build_tool,
                std::shared_ptr<logging::log> log);

        /// Clones, checks out, compiles and extracts the requested contract.
        /// \param req source to build.
        /// \return read-only artifact, or the first failure encountered.
        auto build(const build_request& req) -> build_return_type;

        /// Selects the requested contract from a build's output.
        /// \param output everything the build produced.
        /// \param requested contract to find.
        /// \return the matching artifact, or contract_not_found or
        ///         malformed_artifact.
        static auto select(build_tool::build_output& output,
                           const contract_id& requested)
            -> std::variant<build_artifact, build_failure>;

      private:
        std::string m_work_root;
        std::shared_ptr<source_control::interface> m_source_control;
        std::shared_ptr<build_tool::interface> m_build_tool;
        std::shared_ptr<logging::log> m_log;
    };
}

#endif // CODEPROOF_SRC_ARTIFACT_BUILDER_H_
