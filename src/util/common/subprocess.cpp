// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace codeproof::subprocess {
    namespace {
        /// Builds the child's environment as NAME=value strings.
        auto make_environment(const env_t& overrides)
            -> std::vector<std::string> {
            auto ret = std::vector<std::string>();
            for(char** e = environ; e != nullptr && *e != nullptr; e++) {
                auto entry = std::string(*e);
                auto name = entry.substr(0, entry.find('='));
                auto overridden = false;
                for(const auto& [key, value] : overrides) {
                    if(key == name) {
                        overridden = true;
                        break;
                    }
                }
                if(!overridden) {
                    ret.emplace_back(std::move(entry));
                }
            }
            for(const auto& [key, value] : overrides) {
                ret.emplace_back(key + "=" + value);
            }
            return ret;
        }

        auto to_c_array(std::vector<std::string>& strs)
            -> std::vector<char*> {
            auto ret = std::vector<char*>();
            ret.reserve(strs.size() + 1);
            for(auto& s : strs) {
                ret.push_back(s.data());
            }
            ret.push_back(nullptr);
            return ret;
        }

        void close_fd(int& fd) {
            if(fd >= 0) {
                close(fd);
                fd = -1;
            }
        }
    }

    auto result::success() const -> bool {
        return m_exit_code == 0;
    }

    auto run(const std::vector<std::string>& argv,
             const std::string& cwd,
             const env_t& env) -> std::variant<result, std::string> {
        if(argv.empty()) {
            return std::string("empty command line");
        }

        // Prepared before fork so the child only calls async-signal-safe
        // functions.
        auto args = argv;
        auto c_args = to_c_array(args);
        auto env_strs = make_environment(env);
        auto c_env = to_c_array(env_strs);

        std::array<int, 2> out_pipe{-1, -1};
        std::array<int, 2> err_pipe{-1, -1};
        // Children forked by concurrent runs must not inherit either end.
        // dup2 clears the flag on 1 and 2.
        if(pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
            return "pipe failed: " + std::string(std::strerror(errno));
        }
        if(pipe2(err_pipe.data(), O_CLOEXEC) != 0) {
            auto err = std::string(std::strerror(errno));
            close_fd(out_pipe[0]);
            close_fd(out_pipe[1]);
            return "pipe failed: " + err;
        }

        auto pid = fork();
        if(pid < 0) {
            auto err = std::string(std::strerror(errno));
            close_fd(out_pipe[0]);
            close_fd(out_pipe[1]);
            close_fd(err_pipe[0]);
            close_fd(err_pipe[1]);
            return "fork failed: " + err;
        }

        if(pid == 0) {
            close(out_pipe[0]);
            close(err_pipe[0]);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(out_pipe[1], STDERR_FILENO);
            close(out_pipe[1]);
            auto child_errno = 0;
            if(!cwd.empty() && chdir(cwd.c_str()) != 0) {
                child_errno = errno;
            } else {
                execvpe(c_args[0], c_args.data(), c_env.data());
                child_errno = errno;
            }
            // Reports the failure to the parent through the close-on-exec
            // pipe.
            [[maybe_unused]] auto n
                = write(err_pipe[1], &child_errno, sizeof(child_errno));
            _exit(127);
        }

        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);

        auto res = result{};
        static constexpr size_t read_chunk = 4096;
        auto chunk = std::array<char, read_chunk>();
        for(;;) {
            auto n = read(out_pipe[0], chunk.data(), chunk.size());
            if(n > 0) {
                res.m_output.append(chunk.data(), static_cast<size_t>(n));
            } else if(n == 0 || errno != EINTR) {
                break;
            }
        }
        close_fd(out_pipe[0]);

        auto child_errno = 0;
        ssize_t err_n{};
        do {
            err_n = read(err_pipe[0], &child_errno, sizeof(child_errno));
        } while(err_n < 0 && errno == EINTR);
        close_fd(err_pipe[0]);

        auto status = 0;
        while(waitpid(pid, &status, 0) < 0) {
            if(errno != EINTR) {
                return "waitpid failed: " + std::string(std::strerror(errno));
            }
        }

        if(err_n == sizeof(child_errno)) {
            return "failed to start " + argv[0] + ": "
                 + std::string(std::strerror(child_errno));
        }

        static constexpr int signal_base = 128;
        if(WIFEXITED(status)) {
            res.m_exit_code = WEXITSTATUS(status);
        } else if(WIFSIGNALED(status)) {
            res.m_exit_code = signal_base + WTERMSIG(status);
        }
        return res;
    }
}
