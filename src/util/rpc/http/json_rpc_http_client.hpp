// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_RPC_JSON_RPC_HTTP_CLIENT_H_
#define CODEPROOF_SRC_RPC_JSON_RPC_HTTP_CLIENT_H_

#include "epoll_event_handler.hpp"
#include "util/common/logging.hpp"

#include <chrono>
#include <curl/curl.h>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace codeproof::rpc {
    /// Reason an HTTP JSON-RPC exchange produced no response object.
    struct http_failure {
        /// Human-readable description, e.g. the libcurl error or the HTTP
        /// status.
        std::string m_message;
    };

    /// Outcome of a call: the full JSON-RPC response object, or why there
    /// is none.
    using http_result = std::variant<Json::Value, http_failure>;

    /// \brief Non-blocking HTTP JSON-RPC client using the libcurl multi
    ///        interface over epoll.
    ///
    /// Calls are queued with \ref call and progress only while \ref pump
    /// runs. Consecutive calls rotate across the configured endpoints, so a
    /// retried call lands on the next endpoint. Not thread-safe: a client
    /// belongs to the thread that pumps it.
    class json_rpc_http_client {
      public:
        /// Identifies a queued call.
        using call_id = uint64_t;

        /// Constructor.
        /// \param endpoints JSON-RPC endpoint URLs.
        /// \param timeout per-transfer timeout enforced by libcurl.
        /// \param log log instance.
        json_rpc_http_client(std::vector<std::string> endpoints,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<logging::log> log);

        /// Aborts unfinished transfers.
        ~json_rpc_http_client();

        json_rpc_http_client(const json_rpc_http_client&) = delete;
        auto operator=(const json_rpc_http_client&)
            -> json_rpc_http_client& = delete;
        json_rpc_http_client(json_rpc_http_client&&) = delete;
        auto
        operator=(json_rpc_http_client&&) -> json_rpc_http_client& = delete;

        /// Queues a JSON-RPC 2.0 call.
        /// \param method method name.
        /// \param params positional parameters.
        /// \return identifier to collect the outcome with \ref take, or the
        ///         reason the call could not be started.
        auto call(const std::string& method, const Json::Value& params)
            -> std::variant<call_id, http_failure>;

        /// Drives queued transfers, waiting at most max_wait for socket
        /// activity.
        /// \param max_wait longest time to block.
        /// \return false if the event loop failed.
        [[nodiscard]] auto pump(std::chrono::milliseconds max_wait) -> bool;

        /// Removes and returns the outcome of a finished call.
        /// \param id call to collect.
        /// \return outcome, or std::nullopt if the call has not finished.
        auto take(call_id id) -> std::optional<http_result>;

        /// Aborts a call that has not finished. Its outcome is discarded.
        /// \param id call to abort.
        void cancel(call_id id);

        /// Returns the number of transfers in progress.
        [[nodiscard]] auto pending() const -> size_t;

      private:
        struct transfer {
            call_id m_id{};
            std::string m_request;
            std::string m_response;
        };

        std::vector<std::string> m_endpoints;
        std::chrono::milliseconds m_timeout;
        std::shared_ptr<logging::log> m_log;

        epoll_event_handler m_events;
        CURLM* m_multi{};
        curl_slist* m_headers{};
        std::vector<CURL*> m_idle;
        std::unordered_map<CURL*, std::unique_ptr<transfer>> m_transfers;
        std::unordered_map<call_id, http_result> m_finished;

        size_t m_next_endpoint{};
        call_id m_next_id{1};

        auto acquire_handle() -> CURL*;
        void release_handle(CURL* handle);
        void collect_finished();
        auto to_result(CURL* handle, const transfer& tf, CURLcode code)
            -> http_result;

        static auto on_data(char* ptr, size_t size, size_t nmemb, void* tf)
            -> size_t;
        static auto on_socket(CURL* handle,
                              curl_socket_t s,
                              int what,
                              void* client,
                              void* socketp) -> int;
        static auto on_timer(CURLM* multi, long timeout_ms, void* client)
            -> int;
    };
}

#endif // CODEPROOF_SRC_RPC_JSON_RPC_HTTP_CLIENT_H_
