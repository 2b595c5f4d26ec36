// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fetcher.hpp"

#include <algorithm>
#include <thread>

namespace codeproof::chain {
    auto retry_policy::delay(size_t retry) const -> std::chrono::milliseconds {
        auto d = m_base_delay;
        for(size_t i = 0; i < retry && d < m_max_delay; i++) {
            d *= 2;
        }
        return std::min(d, m_max_delay);
    }

    fetcher::fetcher(std::shared_ptr<rpc::interface> rpc,
                     retry_policy policy,
                     std::shared_ptr<const std::atomic_bool> cancelled,
                     std::shared_ptr<logging::log> log)
        : m_rpc(std::move(rpc)),
          m_policy(policy),
          m_cancelled(std::move(cancelled)),
          m_log(std::move(log)) {}

    auto fetcher::is_cancelled() const -> bool {
        return m_cancelled && m_cancelled->load();
    }

    auto fetcher::backoff(std::chrono::milliseconds delay) -> bool {
        static constexpr auto slice = std::chrono::milliseconds(10);
        auto until = std::chrono::steady_clock::now() + delay;
        while(std::chrono::steady_clock::now() < until) {
            if(is_cancelled()) {
                return false;
            }
            auto left = until - std::chrono::steady_clock::now();
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(left, slice));
        }
        return !is_cancelled();
    }

    template<typename T>
    auto fetcher::with_retry(
        const std::string& what,
        const std::function<std::variant<T, rpc_failure>()>& fn)
        -> std::variant<T, chain_failure> {
        auto last_error = std::string();
        for(size_t attempt = 0; attempt <= m_policy.m_max_retries; attempt++) {
            if(attempt > 0) {
                auto d = m_policy.delay(attempt - 1);
                m_log->debug(what,
                             "retry",
                             attempt,
                             "of",
                             m_policy.m_max_retries,
                             "in",
                             d.count(),
                             "ms");
                if(!backoff(d)) {
                    break;
                }
            }
            if(is_cancelled()) {
                break;
            }
            auto res = fn();
            if(std::holds_alternative<T>(res)) {
                return std::move(std::get<T>(res));
            }
            last_error = std::get<rpc_failure>(res).m_message;
            m_log->warn(what, "attempt", attempt + 1, "failed:", last_error);
        }

        if(is_cancelled()) {
            return chain_failure{chain_error::cancelled,
                                 what + " cancelled by request deadline"};
        }
        return chain_failure{chain_error::rpc_error, last_error};
    }

    auto fetcher::fetch_code(const evmc::address& addr) -> deployed_code {
        using code_t = rpc::interface::code_return_type;
        auto res = with_retry<buffer>("eth_getCode", [&]() -> code_t {
            return m_rpc->get_code(addr);
        });
        if(std::holds_alternative<chain_failure>(res)) {
            return std::get<chain_failure>(res);
        }
        auto& code = std::get<buffer>(res);
        if(code.empty()) {
            return code_absent{};
        }
        return code_present{std::move(code)};
    }

    auto fetcher::fetch_creation_input(const evmc::bytes32& tx_hash)
        -> creation_input {
        using tx_t = std::optional<transaction>;
        auto res = with_retry<tx_t>(
            "eth_getTransactionByHash",
            [&]() -> rpc::interface::transaction_return_type {
                return m_rpc->get_transaction(tx_hash);
            });
        if(std::holds_alternative<chain_failure>(res)) {
            return std::get<chain_failure>(res);
        }
        auto& tx = std::get<tx_t>(res);
        if(!tx.has_value()) {
            return chain_failure{chain_error::tx_not_found,
                                 "no transaction with the given hash"};
        }
        if(!tx->m_block.has_value()) {
            return chain_failure{chain_error::tx_pending,
                                 "transaction has no inclusion block"};
        }
        return creation_tx{std::move(tx->m_input), tx->m_block.value()};
    }
}
