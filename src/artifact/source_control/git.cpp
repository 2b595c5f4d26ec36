// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "git.hpp"

#include "util/common/subprocess.hpp"

namespace codeproof::artifact::source_control {
    namespace {
        auto run_git(const std::vector<std::string>& argv,
                     build_error on_error,
                     const std::shared_ptr<logging::log>& log)
            -> std::optional<build_failure> {
            // Never block on a credential prompt.
            auto env = subprocess::env_t{{"GIT_TERMINAL_PROMPT", "0"}};
            auto res = subprocess::run(argv, {}, env);
            if(std::holds_alternative<std::string>(res)) {
                log->error(std::get<std::string>(res));
                return build_failure{on_error, std::get<std::string>(res)};
            }
            auto& out = std::get<subprocess::result>(res);
            if(!out.success()) {
                log->warn(argv[1], "exited with", out.m_exit_code);
                return build_failure{on_error, out.m_output};
            }
            return std::nullopt;
        }
    }

    git::git(std::string git_path, std::shared_ptr<logging::log> log)
        : m_git_path(std::move(git_path)),
          m_log(std::move(log)) {}

    auto git::clone(const std::string& url, const std::filesystem::path& dir)
        -> std::optional<build_failure> {
        m_log->info("Cloning", url);
        return run_git(
            {m_git_path, "clone", "--quiet", "--", url, dir.string()},
            build_error::clone_failed,
            m_log);
    }

    auto git::checkout(const std::filesystem::path& dir,
                       const std::string& commit)
        -> std::optional<build_failure> {
        m_log->info("Checking out", commit);
        return run_git(
            {m_git_path, "-C", dir.string(), "checkout", "--quiet", commit},
            build_error::checkout_failed,
            m_log);
    }
}
