// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/rpc/http/epoll_event_handler.hpp"
#include "util/rpc/http/json_rpc_http_client.hpp"

#include <gtest/gtest.h>

using codeproof::rpc::http_failure;
using codeproof::rpc::json_rpc_http_client;

class json_rpc_http_client_test : public ::testing::Test {
  protected:
    auto make_client(std::vector<std::string> endpoints)
        -> std::unique_ptr<json_rpc_http_client> {
        return std::make_unique<json_rpc_http_client>(
            std::move(endpoints),
            std::chrono::milliseconds(2000),
            m_log);
    }

    std::shared_ptr<codeproof::logging::log> m_log{
        std::make_shared<codeproof::logging::log>(
            codeproof::logging::log_level::fatal)};
};

TEST_F(json_rpc_http_client_test, no_endpoints) {
    auto client = make_client({});
    auto res = client->call("eth_chainId", Json::Value(Json::arrayValue));
    ASSERT_TRUE(std::holds_alternative<http_failure>(res));
    ASSERT_EQ(client->pending(), 0UL);
}

TEST_F(json_rpc_http_client_test, unreachable_endpoint) {
    auto client = make_client({"http://127.0.0.1:1"});
    auto res = client->call("eth_chainId", Json::Value(Json::arrayValue));
    ASSERT_TRUE(std::holds_alternative<json_rpc_http_client::call_id>(res));
    auto id = std::get<json_rpc_http_client::call_id>(res);
    ASSERT_EQ(client->pending(), 1UL);

    auto deadline
        = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    auto outcome = client->take(id);
    while(!outcome.has_value()
          && std::chrono::steady_clock::now() < deadline) {
        ASSERT_TRUE(client->pump(std::chrono::milliseconds(50)));
        outcome = client->take(id);
    }
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(std::holds_alternative<http_failure>(outcome.value()));
    ASSERT_FALSE(std::get<http_failure>(outcome.value()).m_message.empty());
    ASSERT_EQ(client->pending(), 0UL);
    ASSERT_FALSE(client->take(id).has_value());
}

TEST_F(json_rpc_http_client_test, cancel_discards_call) {
    auto client = make_client({"http://127.0.0.1:1"});
    auto res = client->call("eth_chainId", Json::Value(Json::arrayValue));
    ASSERT_TRUE(std::holds_alternative<json_rpc_http_client::call_id>(res));
    auto id = std::get<json_rpc_http_client::call_id>(res);
    client->cancel(id);
    ASSERT_EQ(client->pending(), 0UL);
    ASSERT_TRUE(client->pump(std::chrono::milliseconds(10)));
    ASSERT_FALSE(client->take(id).has_value());
}

TEST(epoll_event_handler_test, timer_fires_once) {
    auto handler = codeproof::rpc::epoll_event_handler();
    ASSERT_TRUE(handler.init());
    handler.set_timer(std::chrono::milliseconds(10));

    auto start = std::chrono::steady_clock::now();
    auto events = handler.poll(std::chrono::milliseconds(2000));
    ASSERT_LT(std::chrono::steady_clock::now() - start,
              std::chrono::milliseconds(1000));
    ASSERT_TRUE(events.has_value());
    ASSERT_EQ(events->size(), 1UL);
    ASSERT_TRUE(events->front().m_timeout);

    events = handler.poll(std::chrono::milliseconds(10));
    ASSERT_TRUE(events.has_value());
    ASSERT_TRUE(events->empty());
}

TEST(epoll_event_handler_test, disarmed_timer) {
    auto handler = codeproof::rpc::epoll_event_handler();
    ASSERT_TRUE(handler.init());
    handler.set_timer(std::chrono::milliseconds(5));
    handler.set_timer(std::chrono::milliseconds(-1));
    auto events = handler.poll(std::chrono::milliseconds(20));
    ASSERT_TRUE(events.has_value());
    ASSERT_TRUE(events->empty());
}
