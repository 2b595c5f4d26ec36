// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_CHAIN_RPC_HTTP_CLIENT_H_
#define CODEPROOF_SRC_CHAIN_RPC_HTTP_CLIENT_H_

#include "interface.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/http/json_rpc_http_client.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace codeproof::chain::rpc {
    /// Chain RPC implementation speaking Ethereum JSON-RPC over HTTP. Each
    /// call is issued on an asynchronous client which is pumped on the
    /// calling thread until the response arrives or the call times out.
    class http_client : public interface {
      public:
        /// Constructor.
        /// \param endpoints JSON-RPC endpoint URLs. Calls rotate through
        ///                  them.
        /// \param timeout per-call timeout.
        /// \param log log instance.
        http_client(std::vector<std::string> endpoints,
                    std::chrono::milliseconds timeout,
                    std::shared_ptr<logging::log> log);

        /// Calls eth_getCode(addr, "latest").
        auto get_code(const evmc::address& addr) -> code_return_type override;

        /// Calls eth_getTransactionByHash(tx_hash).
        auto get_transaction(const evmc::bytes32& tx_hash)
            -> transaction_return_type override;

      private:
        std::shared_ptr<logging::log> m_log;
        std::chrono::milliseconds m_timeout;
        codeproof::rpc::json_rpc_http_client m_client;

        /// Issues a call and waits for the "result" member of the response.
        auto call(const std::string& method, Json::Value params)
            -> std::variant<Json::Value, rpc_failure>;
    };
}

#endif // CODEPROOF_SRC_CHAIN_RPC_HTTP_CLIENT_H_
