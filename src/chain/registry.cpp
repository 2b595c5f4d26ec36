// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry.hpp"

#include "rpc/http_client.hpp"

#include <algorithm>

namespace codeproof::chain {
    registry::registry(std::vector<chain_info> chains) {
        std::stable_sort(chains.begin(),
                         chains.end(),
                         [](const chain_info& a, const chain_info& b) {
                             return a.m_id < b.m_id;
                         });
        for(auto& c : chains) {
            if(!m_chains.empty() && m_chains.back().m_id == c.m_id) {
                continue;
            }
            m_chains.emplace_back(std::move(c));
        }
    }

    auto registry::from_options(const config::options& opts) -> registry {
        auto chains = std::vector<chain_info>();
        chains.reserve(opts.m_chains.size());
        for(const auto& c : opts.m_chains) {
            chains.push_back(chain_info{c.m_id, c.m_name, c.m_rpc_urls});
        }
        return registry(std::move(chains));
    }

    auto registry::find(chain_id_type id) const -> std::optional<chain_info> {
        auto it = std::lower_bound(m_chains.begin(),
                                   m_chains.end(),
                                   id,
                                   [](const chain_info& c, chain_id_type v) {
                                       return c.m_id < v;
                                   });
        if(it == m_chains.end() || it->m_id != id) {
            return std::nullopt;
        }
        return *it;
    }

    auto registry::all() const -> const std::vector<chain_info>& {
        return m_chains;
    }

    auto registry::empty() const -> bool {
        return m_chains.empty();
    }

    auto make_http_rpc_factory(std::chrono::milliseconds timeout,
                               std::shared_ptr<logging::log> log)
        -> rpc_factory {
        return [timeout, log](const chain_info& chain) {
            return std::make_shared<rpc::http_client>(
                chain.m_rpc_urls,
                timeout,
                log->with_tag("chain " + std::to_string(chain.m_id)));
        };
    }
}
