// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "http_client.hpp"

#include "chain/util.hpp"

namespace codeproof::chain::rpc {
    http_client::http_client(std::vector<std::string> endpoints,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<logging::log> log)
        : m_log(std::move(log)),
          m_timeout(timeout),
          m_client(std::move(endpoints), timeout, m_log) {}

    auto http_client::call(const std::string& method, Json::Value params)
        -> std::variant<Json::Value, rpc_failure> {
        auto started = m_client.call(method, params);
        if(std::holds_alternative<codeproof::rpc::http_failure>(started)) {
            return rpc_failure{
                method + " failed: "
                + std::get<codeproof::rpc::http_failure>(started).m_message};
        }
        auto id = std::get<codeproof::rpc::json_rpc_http_client::call_id>(
            started);

        // Curl enforces the timeout itself; the slack only guards against
        // a stuck event loop.
        static constexpr auto slack = std::chrono::milliseconds(500);
        static constexpr auto max_pump = std::chrono::milliseconds(50);
        auto deadline = std::chrono::steady_clock::now() + m_timeout + slack;
        auto outcome = m_client.take(id);
        while(!outcome.has_value()) {
            if(std::chrono::steady_clock::now() >= deadline) {
                m_client.cancel(id);
                return rpc_failure{method + " timed out"};
            }
            if(!m_client.pump(max_pump)) {
                m_client.cancel(id);
                return rpc_failure{method + " failed: event loop error"};
            }
            outcome = m_client.take(id);
        }

        if(std::holds_alternative<codeproof::rpc::http_failure>(
               outcome.value())) {
            return rpc_failure{method + " failed: "
                               + std::get<codeproof::rpc::http_failure>(
                                     outcome.value())
                                     .m_message};
        }
        auto& resp = std::get<Json::Value>(outcome.value());
        if(resp.isMember("error")) {
            auto& err = resp["error"];
            auto msg = err.isObject() && err["message"].isString()
                         ? err["message"].asString()
                         : err.toStyledString();
            return rpc_failure{method + " returned error: " + msg};
        }
        if(!resp.isMember("result")) {
            return rpc_failure{method + " response has no result"};
        }
        return resp["result"];
    }

    auto http_client::get_code(const evmc::address& addr)
        -> code_return_type {
        auto params = Json::Value(Json::arrayValue);
        params.append("0x" + to_hex(addr));
        params.append("latest");
        auto res = call("eth_getCode", std::move(params));
        if(std::holds_alternative<rpc_failure>(res)) {
            return std::get<rpc_failure>(res);
        }
        auto& val = std::get<Json::Value>(res);
        if(!val.isString()) {
            return rpc_failure{"eth_getCode result is not a string"};
        }
        auto code = bytes_from_rpc_hex(val.asString());
        if(!code.has_value()) {
            return rpc_failure{"eth_getCode result is not 0x-prefixed hex"};
        }
        m_log->trace("eth_getCode returned", code->size(), "bytes");
        return code.value();
    }

    auto http_client::get_transaction(const evmc::bytes32& tx_hash)
        -> transaction_return_type {
        auto params = Json::Value(Json::arrayValue);
        params.append("0x" + to_hex(tx_hash));
        auto res = call("eth_getTransactionByHash", std::move(params));
        if(std::holds_alternative<rpc_failure>(res)) {
            return std::get<rpc_failure>(res);
        }
        auto& val = std::get<Json::Value>(res);
        if(val.isNull()) {
            return std::nullopt;
        }
        if(!val.isObject() || !val["input"].isString()) {
            return rpc_failure{"eth_getTransactionByHash result malformed"};
        }

        auto tx = transaction{};
        auto input = bytes_from_rpc_hex(val["input"].asString());
        if(!input.has_value()) {
            return rpc_failure{"transaction input is not 0x-prefixed hex"};
        }
        tx.m_input = std::move(input.value());

        const auto& block = val["blockNumber"];
        if(!block.isNull()) {
            if(!block.isString()) {
                return rpc_failure{"transaction blockNumber malformed"};
            }
            auto num = quantity_from_hex(block.asString());
            if(!num.has_value()) {
                return rpc_failure{"transaction blockNumber malformed"};
            }
            tx.m_block = num.value();
        }
        return tx;
    }
}
