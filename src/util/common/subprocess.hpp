// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_COMMON_SUBPROCESS_H_
#define CODEPROOF_SRC_COMMON_SUBPROCESS_H_

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace codeproof::subprocess {
    /// Outcome of a process that was started successfully.
    struct result {
        /// Exit status. 128 + signal number if the process was killed by a
        /// signal.
        int m_exit_code{};
        /// Combined stdout and stderr output.
        std::string m_output;

        /// Returns true if the process exited with status zero.
        [[nodiscard]] auto success() const -> bool;
    };

    /// Environment variable overrides, applied on top of the parent's
    /// environment.
    using env_t = std::vector<std::pair<std::string, std::string>>;

    /// Runs an executable to completion, capturing its output.
    ///
    /// The executable is looked up on PATH when argv[0] has no slash.
    /// \param argv program name followed by its arguments. Must not be
    ///             empty.
    /// \param cwd working directory for the child. Empty keeps the
    ///            parent's.
    /// \param env environment overrides for the child.
    /// \return exit status and output, or an error message if the process
    ///         could not be started.
    auto run(const std::vector<std::string>& argv,
             const std::string& cwd = {},
             const env_t& env = {}) -> std::variant<result, std::string>;
}

#endif // CODEPROOF_SRC_COMMON_SUBPROCESS_H_
