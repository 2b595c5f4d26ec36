// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "json_rpc_http_client.hpp"

namespace codeproof::rpc {
    namespace {
        /// Performs libcurl global initialization once per process.
        class curl_global {
          public:
            curl_global() {
                curl_global_init(CURL_GLOBAL_ALL);
            }

            ~curl_global() {
                curl_global_cleanup();
            }

            curl_global(const curl_global&) = delete;
            auto operator=(const curl_global&) -> curl_global& = delete;
            curl_global(curl_global&&) = delete;
            auto operator=(curl_global&&) -> curl_global& = delete;
        };

        void init_curl() {
            static const auto global = curl_global();
        }

        auto to_interest(int what)
            -> std::optional<epoll_event_handler::interest> {
            switch(what) {
                case CURL_POLL_REMOVE:
                    return epoll_event_handler::interest::remove;
                case CURL_POLL_IN:
                    return epoll_event_handler::interest::in;
                case CURL_POLL_OUT:
                    return epoll_event_handler::interest::out;
                case CURL_POLL_INOUT:
                    return epoll_event_handler::interest::inout;
                default:
                    return std::nullopt;
            }
        }
    }

    json_rpc_http_client::json_rpc_http_client(
        std::vector<std::string> endpoints,
        std::chrono::milliseconds timeout,
        std::shared_ptr<logging::log> log)
        : m_endpoints(std::move(endpoints)),
          m_timeout(timeout),
          m_log(std::move(log)) {
        init_curl();
        if(!m_events.init()) {
            m_log->error("Failed to create epoll instance");
            return;
        }
        m_multi = curl_multi_init();
        if(m_multi == nullptr) {
            m_log->error("Failed to create curl multi handle");
            return;
        }
        curl_multi_setopt(m_multi, CURLMOPT_SOCKETFUNCTION, on_socket);
        curl_multi_setopt(m_multi, CURLMOPT_SOCKETDATA, this);
        curl_multi_setopt(m_multi, CURLMOPT_TIMERFUNCTION, on_timer);
        curl_multi_setopt(m_multi, CURLMOPT_TIMERDATA, this);
        m_headers
            = curl_slist_append(m_headers, "Content-Type: application/json");
    }

    json_rpc_http_client::~json_rpc_http_client() {
        for(auto& entry : m_transfers) {
            curl_multi_remove_handle(m_multi, entry.first);
            curl_easy_cleanup(entry.first);
        }
        m_transfers.clear();
        for(auto* handle : m_idle) {
            curl_easy_cleanup(handle);
        }
        if(m_multi != nullptr) {
            curl_multi_cleanup(m_multi);
        }
        curl_slist_free_all(m_headers);
    }

    auto json_rpc_http_client::acquire_handle() -> CURL* {
        if(!m_idle.empty()) {
            auto* handle = m_idle.back();
            m_idle.pop_back();
            return handle;
        }
        auto* handle = curl_easy_init();
        if(handle == nullptr) {
            return nullptr;
        }
        static constexpr long connect_timeout_s = 3;
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, on_data);
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, m_headers);
        curl_easy_setopt(handle,
                         CURLOPT_TIMEOUT_MS,
                         static_cast<long>(m_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, connect_timeout_s);
        return handle;
    }

    void json_rpc_http_client::release_handle(CURL* handle) {
        if(curl_multi_remove_handle(m_multi, handle) != CURLM_OK) {
            m_log->warn("Dropping curl handle that failed to detach");
            curl_easy_cleanup(handle);
            return;
        }
        m_idle.push_back(handle);
    }

    auto json_rpc_http_client::call(const std::string& method,
                                    const Json::Value& params)
        -> std::variant<call_id, http_failure> {
        if(m_multi == nullptr || m_endpoints.empty()) {
            return http_failure{"client not initialized"};
        }
        auto* handle = acquire_handle();
        if(handle == nullptr) {
            return http_failure{"failed to create curl handle"};
        }

        const auto& url = m_endpoints[m_next_endpoint];
        m_next_endpoint = (m_next_endpoint + 1) % m_endpoints.size();

        auto tf = std::make_unique<transfer>();
        tf->m_id = m_next_id++;
        auto payload = Json::Value(Json::objectValue);
        payload["jsonrpc"] = "2.0";
        payload["id"] = Json::UInt64(tf->m_id);
        payload["method"] = method;
        payload["params"] = params;
        auto writer = Json::StreamWriterBuilder();
        writer["indentation"] = "";
        tf->m_request = Json::writeString(writer, payload);

        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, tf->m_request.c_str());
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, tf.get());

        if(curl_multi_add_handle(m_multi, handle) != CURLM_OK) {
            curl_easy_cleanup(handle);
            return http_failure{"failed to start transfer to " + url};
        }
        m_log->trace("Calling", method, "on", url);
        auto id = tf->m_id;
        m_transfers.emplace(handle, std::move(tf));
        return id;
    }

    auto json_rpc_http_client::pump(std::chrono::milliseconds max_wait)
        -> bool {
        if(m_multi == nullptr) {
            return false;
        }
        auto events = m_events.poll(max_wait);
        if(!events.has_value()) {
            m_log->error("epoll_wait failed");
            return false;
        }
        int running{};
        for(const auto& ev : events.value()) {
            auto fd = ev.m_timeout ? CURL_SOCKET_TIMEOUT
                                   : static_cast<curl_socket_t>(ev.m_fd);
            curl_multi_socket_action(m_multi, fd, 0, &running);
        }
        collect_finished();
        return true;
    }

    void json_rpc_http_client::collect_finished() {
        int remaining{};
        while(auto* msg = curl_multi_info_read(m_multi, &remaining)) {
            if(msg->msg != CURLMSG_DONE) {
                continue;
            }
            auto* handle = msg->easy_handle;
            auto code = msg->data.result;
            auto it = m_transfers.find(handle);
            if(it == m_transfers.end()) {
                release_handle(handle);
                continue;
            }
            auto tf = std::move(it->second);
            m_transfers.erase(it);
            m_finished.emplace(tf->m_id, to_result(handle, *tf, code));
            release_handle(handle);
        }
    }

    auto json_rpc_http_client::to_result(CURL* handle,
                                         const transfer& tf,
                                         CURLcode code) -> http_result {
        if(code != CURLE_OK) {
            return http_failure{curl_easy_strerror(code)};
        }
        long status{};
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        static constexpr long ok_min = 200;
        static constexpr long ok_max = 299;
        if(status < ok_min || status > ok_max) {
            return http_failure{"HTTP status " + std::to_string(status)};
        }
        auto res = Json::Value();
        auto r = Json::Reader();
        if(!r.parse(tf.m_response, res, false) || !res.isObject()) {
            m_log->debug("Unparsable response body:", tf.m_response);
            return http_failure{"response is not a JSON object"};
        }
        return res;
    }

    auto json_rpc_http_client::take(call_id id)
        -> std::optional<http_result> {
        auto it = m_finished.find(id);
        if(it == m_finished.end()) {
            return std::nullopt;
        }
        auto ret = std::move(it->second);
        m_finished.erase(it);
        return ret;
    }

    void json_rpc_http_client::cancel(call_id id) {
        if(m_finished.erase(id) != 0) {
            return;
        }
        for(auto it = m_transfers.begin(); it != m_transfers.end(); it++) {
            if(it->second->m_id == id) {
                auto* handle = it->first;
                m_transfers.erase(it);
                release_handle(handle);
                return;
            }
        }
    }

    auto json_rpc_http_client::pending() const -> size_t {
        return m_transfers.size();
    }

    auto json_rpc_http_client::on_data(char* ptr,
                                       size_t size,
                                       size_t nmemb,
                                       void* tf) -> size_t {
        auto n = size * nmemb;
        static_cast<transfer*>(tf)->m_response.append(ptr, n);
        return n;
    }

    auto json_rpc_http_client::on_socket(CURL* /* handle */,
                                         curl_socket_t s,
                                         int what,
                                         void* client,
                                         void* /* socketp */) -> int {
        auto* self = static_cast<json_rpc_http_client*>(client);
        auto interest = to_interest(what);
        if(!interest.has_value()) {
            return 0;
        }
        if(!self->m_events.watch(static_cast<int>(s), interest.value())) {
            self->m_log->warn("epoll_ctl failed for socket", s);
            return -1;
        }
        return 0;
    }

    auto json_rpc_http_client::on_timer(CURLM* /* multi */,
                                        long timeout_ms,
                                        void* client) -> int {
        auto* self = static_cast<json_rpc_http_client*>(client);
        self->m_events.set_timer(std::chrono::milliseconds(timeout_ms));
        return 0;
    }
}
