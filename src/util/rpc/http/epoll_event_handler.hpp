// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_RPC_EPOLL_EVENT_HANDLER_H_
#define CODEPROOF_SRC_RPC_EPOLL_EVENT_HANDLER_H_

#include <chrono>
#include <optional>
#include <set>
#include <vector>

namespace codeproof::rpc {
    /// \brief Tracks readiness of the sockets libcurl hands out, plus the
    ///        single timer libcurl asks for.
    ///
    /// Uses edge-triggered Linux epoll. Not thread-safe.
    class epoll_event_handler {
      public:
        /// Interest registered for a socket.
        enum class interest {
            /// Stop tracking the socket.
            remove,
            /// Readable.
            in,
            /// Writable.
            out,
            /// Readable or writable.
            inout,
        };

        /// Event reported by poll.
        struct event {
            /// Socket with activity. Unused for timer events.
            int m_fd{-1};
            /// True if the armed timer fired.
            bool m_timeout{false};
        };

        epoll_event_handler() = default;
        ~epoll_event_handler();

        epoll_event_handler(const epoll_event_handler&) = delete;
        auto operator=(const epoll_event_handler&)
            -> epoll_event_handler& = delete;
        epoll_event_handler(epoll_event_handler&&) = delete;
        auto
        operator=(epoll_event_handler&&) -> epoll_event_handler& = delete;

        /// Creates the epoll instance.
        /// \return true on success.
        auto init() -> bool;

        /// Arms the one-shot timer reported by poll as a timeout event.
        /// \param delay time until the timer fires. Negative disarms it.
        void set_timer(std::chrono::milliseconds delay);

        /// Updates the interest registered for a socket.
        /// \param fd socket.
        /// \param what interest to register.
        /// \return false if epoll rejected the change.
        auto watch(int fd, interest what) -> bool;

        /// Waits for socket activity or the timer. Returns early on
        /// activity, when the timer fires, or after max_wait.
        /// \param max_wait upper bound on the time spent waiting.
        /// \return events, empty on a plain timeout or signal interruption,
        ///         or std::nullopt if epoll failed.
        auto poll(std::chrono::milliseconds max_wait)
            -> std::optional<std::vector<event>>;

      private:
        using clock_type = std::chrono::steady_clock;

        int m_epoll{-1};
        std::optional<clock_type::time_point> m_timer;
        std::set<int> m_watched;
    };
}

#endif // CODEPROOF_SRC_RPC_EPOLL_EVENT_HANDLER_H_
