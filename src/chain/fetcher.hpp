// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_CHAIN_FETCHER_H_
#define CODEPROOF_SRC_CHAIN_FETCHER_H_

#include "messages.hpp"
#include "rpc/interface.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace codeproof::chain {
    /// Bounded exponential backoff for transient RPC failures.
    struct retry_policy {
        /// Retries after the first attempt.
        size_t m_max_retries{};
        /// Delay before the first retry.
        std::chrono::milliseconds m_base_delay{};
        /// Upper bound on any single delay.
        std::chrono::milliseconds m_max_delay{};

        /// Returns the delay before the given retry.
        /// \param retry zero-based retry number.
        /// \return base * 2^retry, capped at the max delay.
        [[nodiscard]] auto delay(size_t retry) const
            -> std::chrono::milliseconds;
    };

    /// Fetches on-chain data for one chain, retrying transient RPC failures.
    class fetcher {
      public:
        /// Constructor.
        /// \param rpc RPC client for the chain.
        /// \param policy retry policy.
        /// \param cancelled raised when the request deadline passes. Stops
        ///                  retries early.
        /// \param log log instance.
        fetcher(std::shared_ptr<rpc::interface> rpc,
                retry_policy policy,
                std::shared_ptr<const std::atomic_bool> cancelled,
                std::shared_ptr<logging::log> log);

        /// Fetches the code deployed at an address. Empty code is
        /// code_absent.
        /// \param addr contract address.
        /// \return deployed code, or an rpc_error / cancelled failure.
        auto fetch_code(const evmc::address& addr) -> deployed_code;

        /// Fetches the input of a creation transaction.
        /// \param tx_hash transaction hash.
        /// \return transaction input, or a tx_not_found, tx_pending,
        ///         rpc_error or cancelled failure.
        auto fetch_creation_input(const evmc::bytes32& tx_hash)
            -> creation_input;

      private:
        std::shared_ptr<rpc::interface> m_rpc;
        retry_policy m_policy;
        std::shared_ptr<const std::atomic_bool> m_cancelled;
        std::shared_ptr<logging::log> m_log;

        /// Runs fn until it succeeds, the retry budget is used, or the
        /// request is cancelled.
        template<typename T>
        auto with_retry(const std::string& what,
                        const std::function<std::variant<T, rpc_failure>()>&
                            fn) -> std::variant<T, chain_failure>;

        /// Sleeps for the given time, waking early on cancellation.
        /// \return false if cancelled.
        auto backoff(std::chrono::milliseconds delay) -> bool;

        [[nodiscard]] auto is_cancelled() const -> bool;
    };
}

#endif // CODEPROOF_SRC_CHAIN_FETCHER_H_
