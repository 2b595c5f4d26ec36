// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "verifier.hpp"

#include "artifact/build_tool/forge.hpp"
#include "artifact/source_control/git.hpp"
#include "decompiler/cli.hpp"
#include "decompiler/selector_scan.hpp"

namespace codeproof::verifier {
    verifier::verifier(
        std::shared_ptr<artifact::builder> builder,
        std::shared_ptr<orchestrator::orchestrator> orchestrator,
        std::chrono::milliseconds request_timeout,
        std::shared_ptr<logging::log> log)
        : m_builder(std::move(builder)),
          m_orchestrator(std::move(orchestrator)),
          m_request_timeout(request_timeout),
          m_log(std::move(log)) {}

    auto verifier::verify(const verification_request& req)
        -> verify_return_type {
        auto checked = validate(req, m_orchestrator->chains());
        if(std::holds_alternative<request_failure>(checked)) {
            auto& err = std::get<request_failure>(checked);
            m_log->warn("Rejected request:",
                        to_string(err.m_code),
                        err.m_message);
            return verification_error{std::move(err)};
        }
        const auto& valid = std::get<validated_request>(checked);

        auto art = std::shared_ptr<const artifact::build_artifact>();
        if(valid.m_build.has_value()) {
            auto built = m_builder->build(valid.m_build.value());
            if(std::holds_alternative<artifact::build_failure>(built)) {
                auto& err = std::get<artifact::build_failure>(built);
                m_log->warn("Build failed:", artifact::to_string(err.m_code));
                return verification_error{std::move(err)};
            }
            art = std::get<std::shared_ptr<const artifact::build_artifact>>(
                built);
        }

        auto ids = std::vector<chain::chain_id_type>();
        ids.reserve(valid.m_targets.size());
        for(const auto& t : valid.m_targets) {
            ids.push_back(t.m_id);
        }

        const auto deadline
            = std::chrono::steady_clock::now() + m_request_timeout;
        auto results = m_orchestrator->run(ids,
                                           art,
                                           valid.m_address,
                                           valid.m_creation_tx,
                                           deadline);
        return assemble(req, valid.m_targets, art.get(), std::move(results));
    }

    auto make_verifier(const config::options& opts,
                       std::shared_ptr<logging::log> log)
        -> std::unique_ptr<verifier> {
        auto git = std::make_shared<artifact::source_control::git>(
            opts.m_git_path,
            log->with_tag("git"));
        auto forge = std::make_shared<artifact::build_tool::forge>(
            opts.m_forge_path,
            log->with_tag("forge"));
        auto builder = std::make_shared<artifact::builder>(opts.m_work_dir,
                                                           std::move(git),
                                                           std::move(forge),
                                                           log);

        auto decomp = std::shared_ptr<decompiler::interface>();
        if(opts.m_decompiler_path.empty()) {
            decomp = std::make_shared<decompiler::selector_scan>();
        } else {
            decomp = std::make_shared<decompiler::cli>(
                opts.m_decompiler_path,
                opts.m_work_dir,
                log->with_tag("decompiler"));
        }

        auto policy = chain::retry_policy{
            opts.m_rpc_max_retries,
            std::chrono::milliseconds(opts.m_rpc_backoff_ms),
            std::chrono::milliseconds(opts.m_rpc_backoff_max_ms)};
        auto factory = chain::make_http_rpc_factory(
            std::chrono::milliseconds(opts.m_rpc_timeout_ms),
            log);
        auto orch = std::make_shared<orchestrator::orchestrator>(
            chain::registry::from_options(opts),
            std::move(factory),
            policy,
            std::move(decomp),
            opts.m_max_in_flight,
            log);

        return std::make_unique<verifier>(
            std::move(builder),
            std::move(orch),
            std::chrono::milliseconds(opts.m_request_timeout_ms),
            std::move(log));
    }
}
