// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "orchestrator.hpp"

#include <algorithm>
#include <future>

namespace codeproof::orchestrator {
    auto failed_result(const chain::chain_info& chain,
                       chain::chain_error err,
                       std::string msg) -> chain_verification_result {
        auto ret = chain_verification_result();
        ret.m_chain_id = chain.m_id;
        ret.m_chain_name = chain.m_name;
        ret.m_error = chain::chain_failure{err, std::move(msg)};
        return ret;
    }

    orchestrator::orchestrator(
        chain::registry chains,
        chain::rpc_factory factory,
        chain::retry_policy policy,
        std::shared_ptr<decompiler::interface> decompiler,
        size_t max_in_flight,
        std::shared_ptr<logging::log> log)
        : m_chains(std::move(chains)),
          m_factory(std::move(factory)),
          m_policy(policy),
          m_decompiler(std::move(decompiler)),
          m_log(std::move(log)),
          m_pool(max_in_flight) {}

    auto orchestrator::chains() const -> const chain::registry& {
        return m_chains;
    }

    auto orchestrator::run(
        const std::vector<chain::chain_id_type>& targets,
        const std::shared_ptr<const artifact::build_artifact>& art,
        const evmc::address& addr,
        const std::optional<evmc::bytes32>& tx_hash,
        std::chrono::steady_clock::time_point deadline)
        -> std::vector<chain_verification_result> {
        auto cancelled = std::make_shared<std::atomic_bool>(false);

        struct pending {
            chain::chain_info m_chain;
            std::future<chain_verification_result> m_result;
        };
        auto tasks = std::vector<pending>();
        auto ret = std::vector<chain_verification_result>();

        for(const auto id : targets) {
            auto info = m_chains.find(id);
            if(!info.has_value()) {
                ret.emplace_back(failed_result(
                    chain::chain_info{id, {}, {}},
                    chain::chain_error::rpc_error,
                    "chain " + std::to_string(id) + " is not configured"));
                continue;
            }

            auto promise
                = std::make_shared<std::promise<chain_verification_result>>();
            tasks.push_back({info.value(), promise->get_future()});

            auto task = [promise,
                         chain = info.value(),
                         factory = m_factory,
                         policy = m_policy,
                         decomp = m_decompiler,
                         log = m_log->with_tag("chain "
                                               + std::to_string(id)),
                         cancelled,
                         art,
                         addr,
                         tx_hash]() {
                if(cancelled->load()) {
                    promise->set_value(
                        failed_result(chain,
                                      chain::chain_error::cancelled,
                                      "request deadline passed"));
                    return;
                }
                auto res = chain_verification_result();
                try {
                    auto fetch = chain::fetcher(factory(chain),
                                                policy,
                                                cancelled,
                                                log);
                    res = run_chain(chain,
                                    fetch,
                                    addr,
                                    tx_hash,
                                    art.get(),
                                    *decomp,
                                    *log);
                } catch(const std::exception& e) {
                    log->error("Chain task failed:", e.what());
                    res = failed_result(chain,
                                        chain::chain_error::rpc_error,
                                        e.what());
                }
                promise->set_value(std::move(res));
            };

            if(!m_pool.push(std::move(task))) {
                promise->set_value(
                    failed_result(info.value(),
                                  chain::chain_error::cancelled,
                                  "worker pool is shutting down"));
            }
        }

        for(auto& t : tasks) {
            if(t.m_result.wait_until(deadline) == std::future_status::ready) {
                ret.emplace_back(t.m_result.get());
                continue;
            }
            cancelled->store(true);
            m_log->warn("Chain", t.m_chain.m_id, "missed the request deadline");
            ret.emplace_back(failed_result(t.m_chain,
                                           chain::chain_error::cancelled,
                                           "request deadline passed"));
        }

        std::stable_sort(ret.begin(),
                         ret.end(),
                         [](const auto& a, const auto& b) {
                             return a.m_chain_id < b.m_chain_id;
                         });
        return ret;
    }
}
