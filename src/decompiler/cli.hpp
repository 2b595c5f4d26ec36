// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_DECOMPILER_CLI_H_
#define CODEPROOF_SRC_DECOMPILER_CLI_H_

#include "interface.hpp"
#include "util/common/logging.hpp"

#include <filesystem>
#include <memory>

namespace codeproof::decompiler {
    /// Runs an external heimdall-compatible decompiler executable.
    class cli : public interface {
      public:
        /// Constructor.
        /// \param decompiler_path decompiler executable.
        /// \param work_root parent of the temporary output directories.
        ///                  Empty selects the system temporary directory.
        /// \param log log instance.
        cli(std::string decompiler_path,
            std::string work_root,
            std::shared_ptr<logging::log> log);

        /// Runs the decompiler into a temporary directory and reads the
        /// abi.json and decompiled.sol it writes. known_abi is unused.
        auto decompile(const buffer& code, const Json::Value& known_abi)
            -> std::optional<decompilation> override;

        /// Reads the decompiler's output files.
        /// \param dir output directory, searched recursively.
        /// \return decompilation, or std::nullopt if abi.json is missing or
        ///         unreadable.
        static auto read_output(const std::filesystem::path& dir)
            -> std::optional<decompilation>;

      private:
        std::string m_decompiler_path;
        std::string m_work_root;
        std::shared_ptr<logging::log> m_log;
    };
}

#endif // CODEPROOF_SRC_DECOMPILER_CLI_H_
