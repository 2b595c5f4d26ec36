// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cli.hpp"

#include "util/common/scoped_directory.hpp"
#include "util/common/subprocess.hpp"

#include <fstream>
#include <sstream>

namespace codeproof::decompiler {
    namespace {
        constexpr auto abi_file = "abi.json";
        constexpr auto source_file = "decompiled.sol";

        auto find_file(const std::filesystem::path& dir,
                       const std::string& name)
            -> std::optional<std::filesystem::path> {
            auto ec = std::error_code();
            auto it = std::filesystem::recursive_directory_iterator(dir, ec);
            for(; !ec && it != std::filesystem::recursive_directory_iterator();
                it.increment(ec)) {
                if(it->is_regular_file() && it->path().filename() == name) {
                    return it->path();
                }
            }
            return std::nullopt;
        }
    }

    cli::cli(std::string decompiler_path,
             std::string work_root,
             std::shared_ptr<logging::log> log)
        : m_decompiler_path(std::move(decompiler_path)),
          m_work_root(std::move(work_root)),
          m_log(std::move(log)) {}

    auto cli::read_output(const std::filesystem::path& dir)
        -> std::optional<decompilation> {
        auto abi_path = find_file(dir, abi_file);
        if(!abi_path.has_value()) {
            return std::nullopt;
        }

        auto ret = decompilation();
        auto abi_stream = std::ifstream(abi_path.value());
        auto r = Json::Reader();
        if(!r.parse(abi_stream, ret.m_abi, false) || !ret.m_abi.isArray()) {
            return std::nullopt;
        }

        auto src_path = find_file(dir, source_file);
        if(src_path.has_value()) {
            auto src_stream = std::ifstream(src_path.value());
            auto ss = std::stringstream();
            ss << src_stream.rdbuf();
            ret.m_pseudo_source = ss.str();
        }
        return ret;
    }

    auto cli::decompile(const buffer& code, const Json::Value& /* known_abi */)
        -> std::optional<decompilation> {
        if(code.empty()) {
            return std::nullopt;
        }

        auto maybe_dir = scoped_directory::create(m_work_root,
                                                  "codeproof-decompile-");
        if(std::holds_alternative<std::string>(maybe_dir)) {
            m_log->warn("Decompiler output directory:",
                        std::get<std::string>(maybe_dir));
            return std::nullopt;
        }
        const auto dir
            = std::move(std::get<std::unique_ptr<scoped_directory>>(maybe_dir));

        auto res = subprocess::run({m_decompiler_path,
                                    "decompile",
                                    code.to_hex_prefixed(),
                                    "--skip-resolving",
                                    "--include-sol",
                                    "--output",
                                    dir->path().string()},
                                   dir->path().string());
        if(std::holds_alternative<std::string>(res)) {
            m_log->warn("Decompiler failed to start:",
                        std::get<std::string>(res));
            return std::nullopt;
        }
        const auto& out = std::get<subprocess::result>(res);
        if(!out.success()) {
            m_log->warn("Decompiler exited with", out.m_exit_code);
            m_log->debug(out.m_output);
            return std::nullopt;
        }

        auto ret = read_output(dir->path());
        if(!ret.has_value()) {
            m_log->warn("Decompiler produced no readable", abi_file);
        }
        return ret;
    }
}
