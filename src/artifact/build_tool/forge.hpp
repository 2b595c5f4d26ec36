// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ARTIFACT_BUILD_TOOL_FORGE_H_
#define CODEPROOF_SRC_ARTIFACT_BUILD_TOOL_FORGE_H_

#include "interface.hpp"
#include "util/common/logging.hpp"

#include <istream>
#include <memory>

namespace codeproof::artifact::build_tool {
    /// Builds Foundry projects with the forge command-line tool.
    class forge : public interface {
      public:
        /// Name of the project file marking a Foundry project.
        static constexpr auto project_file = "foundry.toml";
        /// Directory, relative to the project root, holding the artifacts.
        static constexpr auto output_dir = "out";
        /// Profile every Foundry project has.
        static constexpr auto default_profile = "default";

        /// Constructor.
        /// \param forge_path forge executable, looked up on PATH if bare.
        /// \param log log instance.
        forge(std::string forge_path, std::shared_ptr<logging::log> log);

        /// Reads the [profile.<name>] sections of foundry.toml.
        auto profiles(const std::filesystem::path& dir)
            -> profiles_return_type override;

        /// Runs forge build with FOUNDRY_PROFILE set and collects every
        /// artifact under out/.
        auto compile(const std::filesystem::path& dir,
                     const std::string& profile)
            -> compile_return_type override;

        /// Extracts profile names from foundry.toml content.
        /// \param toml project file content.
        /// \return profile names, always including "default".
        static auto parse_profiles(std::istream& toml)
            -> std::set<std::string>;

        /// Converts one forge artifact file into a build artifact.
        /// \param json parsed artifact file.
        /// \param file path of the artifact file relative to out/, used for
        ///             the contract name and as a fallback source path.
        /// \return artifact, or the reason it cannot be used.
        static auto parse_artifact(const Json::Value& json,
                                   const std::filesystem::path& file)
            -> std::variant<build_artifact, std::string>;

      private:
        std::string m_forge_path;
        std::shared_ptr<logging::log> m_log;
    };
}

#endif // CODEPROOF_SRC_ARTIFACT_BUILD_TOOL_FORGE_H_
