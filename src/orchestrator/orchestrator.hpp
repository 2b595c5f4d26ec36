// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ORCHESTRATOR_ORCHESTRATOR_H_
#define CODEPROOF_SRC_ORCHESTRATOR_ORCHESTRATOR_H_

#include "pipeline.hpp"
#include "util/common/thread_pool.hpp"

#include <chrono>
#include <vector>

namespace codeproof::orchestrator {
    /// Runs the per-chain pipeline for many chains at once, with a cap on
    /// the number of chains in flight.
    class orchestrator {
      public:
        /// Constructor.
        /// \param chains chains that may be targeted.
        /// \param factory creates the RPC client for a chain.
        /// \param policy retry policy for RPC calls.
        /// \param decompiler decompiler for the fallback stage.
        /// \param max_in_flight maximum number of chains processed at once.
        /// \param log log instance.
        orchestrator(chain::registry chains,
                     chain::rpc_factory factory,
                     chain::retry_policy policy,
                     std::shared_ptr<decompiler::interface> decompiler,
                     size_t max_in_flight,
                     std::shared_ptr<logging::log> log);

        /// Waits for chains still running from timed-out requests.
        ~orchestrator() = default;

        orchestrator(const orchestrator&) = delete;
        auto operator=(const orchestrator&) -> orchestrator& = delete;
        orchestrator(orchestrator&&) = delete;
        auto operator=(orchestrator&&) -> orchestrator& = delete;

        /// \brief Verifies a contract on every target chain.
        ///
        /// Chains not finished by the deadline get a cancelled error and
        /// their retries stop. Finished chains are kept.
        /// \param targets chain IDs to verify.
        /// \param art build artifact shared by every chain, or nullptr if no
        ///            source was supplied.
        /// \param addr contract address.
        /// \param tx_hash creation transaction hash, if supplied.
        /// \param deadline time by which results are returned.
        /// \return one result per target, ordered by chain ID.
        auto run(const std::vector<chain::chain_id_type>& targets,
                 const std::shared_ptr<const artifact::build_artifact>& art,
                 const evmc::address& addr,
                 const std::optional<evmc::bytes32>& tx_hash,
                 std::chrono::steady_clock::time_point deadline)
            -> std::vector<chain_verification_result>;

        [[nodiscard]] auto chains() const -> const chain::registry&;

      private:
        chain::registry m_chains;
        chain::rpc_factory m_factory;
        chain::retry_policy m_policy;
        std::shared_ptr<decompiler::interface> m_decompiler;
        std::shared_ptr<logging::log> m_log;

        // Declared last so its workers are joined before the members they
        // use are destroyed.
        thread_pool m_pool;
    };

    /// Returns a result recording a chain error and no verdicts.
    /// \param chain chain the result is for.
    /// \param err error code.
    /// \param msg error message.
    auto failed_result(const chain::chain_info& chain,
                       chain::chain_error err,
                       std::string msg) -> chain_verification_result;
}

#endif // CODEPROOF_SRC_ORCHESTRATOR_ORCHESTRATOR_H_
