// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "builder.hpp"

#include "util/common/scoped_directory.hpp"

namespace codeproof::artifact {
    namespace {
        constexpr auto work_dir_prefix = "codeproof-build-";
        constexpr auto checkout_dir = "src";
        constexpr auto library_dir = "lib/";

        auto is_library(const contract_id& id) -> bool {
            return id.m_path.compare(0, 4, library_dir) == 0;
        }
    }

    builder::builder(
        std::string work_root,
        std::shared_ptr<source_control::interface> source_control,
        std::shared_ptr<build_tool::interface> build_tool,
        std::shared_ptr<logging::log> log)
        : m_work_root(std::move(work_root)),
          m_source_control(std::move(source_control)),
          m_build_tool(std::move(build_tool)),
          m_log(std::move(log)) {}

    auto builder::select(build_tool::build_output& output,
                         const contract_id& requested)
        -> std::variant<build_artifact, build_failure> {
        // An exact path wins. Otherwise prefer project sources over
        // dependencies under lib/.
        build_artifact* found{nullptr};
        for(auto& c : output.m_contracts) {
            if(!c.m_contract.matches(requested)) {
                continue;
            }
            if(c.m_contract == requested) {
                found = &c;
                break;
            }
            if(found == nullptr
               || (is_library(found->m_contract)
                   && !is_library(c.m_contract))) {
                found = &c;
            }
        }

        if(found == nullptr) {
            // Unparseable outputs are only known by their file name, which
            // may be shorter than the requested path.
            for(const auto& m : output.m_malformed) {
                if(m.m_contract.matches(requested)
                   || requested.matches(m.m_contract)) {
                    return build_failure{build_error::malformed_artifact,
                                         m.m_reason};
                }
            }
            return build_failure{build_error::contract_not_found,
                                 to_string(requested)
                                     + " not found in build output"};
        }

        if(found->m_creation_code.empty() || found->m_runtime_code.empty()) {
            return build_failure{build_error::malformed_artifact,
                                 to_string(found->m_contract)
                                     + " has no bytecode"};
        }
        return std::move(*found);
    }

    auto builder::build(const build_request& req) -> build_return_type {
        auto maybe_dir = scoped_directory::create(m_work_root, work_dir_prefix);
        if(std::holds_alternative<std::string>(maybe_dir)) {
            m_log->error("Failed to create working directory:",
                         std::get<std::string>(maybe_dir));
            return build_failure{build_error::workspace_error,
                                 std::get<std::string>(maybe_dir)};
        }
        const auto work_dir
            = std::move(std::get<std::unique_ptr<scoped_directory>>(maybe_dir));
        const auto project = work_dir->path() / checkout_dir;

        if(auto err = m_source_control->clone(req.m_repo_url, project)) {
            return std::move(err.value());
        }
        if(auto err = m_source_control->checkout(project, req.m_commit)) {
            return std::move(err.value());
        }

        auto profiles = m_build_tool->profiles(project);
        if(std::holds_alternative<build_failure>(profiles)) {
            return std::get<build_failure>(profiles);
        }
        const auto& known = std::get<std::set<std::string>>(profiles);
        if(known.find(req.m_profile) == known.end()) {
            return build_failure{build_error::unknown_profile,
                                 "Profile '" + req.m_profile
                                     + "' is not defined"};
        }

        auto output = m_build_tool->compile(project, req.m_profile);
        if(std::holds_alternative<build_failure>(output)) {
            return std::get<build_failure>(output);
        }

        auto selected = select(std::get<build_tool::build_output>(output),
                               req.m_contract);
        if(std::holds_alternative<build_failure>(selected)) {
            return std::get<build_failure>(selected);
        }

        auto art = std::make_shared<build_artifact>(
            std::move(std::get<build_artifact>(selected)));
        art->m_profile = req.m_profile;
        if(art->m_metadata_appended) {
            art->m_metadata_length
                = bytecode::strip_metadata(art->m_runtime_code)
                      .m_trailer.size();
        }

        m_log->info("Built",
                    to_string(art->m_contract),
                    "with",
                    art->m_compiler_version.empty() ? "unknown compiler"
                                                    : art->m_compiler_version);
        return std::shared_ptr<const build_artifact>(std::move(art));
    }
}
