// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_CHAIN_REGISTRY_H_
#define CODEPROOF_SRC_CHAIN_REGISTRY_H_

#include "messages.hpp"
#include "rpc/interface.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codeproof::chain {
    /// A chain the verifier can target.
    struct chain_info {
        chain_id_type m_id{};
        std::string m_name;
        std::vector<std::string> m_rpc_urls;
    };

    /// Immutable set of configured chains, ordered by chain ID.
    class registry {
      public:
        /// Constructor. Entries with a duplicate ID keep the first.
        /// \param chains chain entries in any order.
        explicit registry(std::vector<chain_info> chains);

        /// Builds a registry from the chains in a configuration.
        /// \param opts configuration options.
        /// \return registry of opts.m_chains.
        static auto from_options(const config::options& opts) -> registry;

        /// Looks up a chain.
        /// \param id chain ID.
        /// \return chain entry, or std::nullopt if not configured.
        [[nodiscard]] auto find(chain_id_type id) const
            -> std::optional<chain_info>;

        /// Returns every configured chain, ordered by chain ID.
        [[nodiscard]] auto all() const -> const std::vector<chain_info>&;

        [[nodiscard]] auto empty() const -> bool;

      private:
        std::vector<chain_info> m_chains;
    };

    /// Creates the RPC client used to reach a chain.
    using rpc_factory = std::function<std::shared_ptr<rpc::interface>(
        const chain_info& chain)>;

    /// Returns a factory producing JSON-RPC over HTTP clients.
    /// \param timeout per-call timeout.
    /// \param log log instance shared with the clients.
    /// \return factory for rpc::http_client instances.
    auto make_http_rpc_factory(std::chrono::milliseconds timeout,
                               std::shared_ptr<logging::log> log)
        -> rpc_factory;
}

#endif // CODEPROOF_SRC_CHAIN_REGISTRY_H_
