// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "epoll_event_handler.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <sys/epoll.h>
#include <unistd.h>

namespace codeproof::rpc {
    epoll_event_handler::~epoll_event_handler() {
        if(m_epoll != -1) {
            close(m_epoll);
        }
    }

    auto epoll_event_handler::init() -> bool {
        m_epoll = epoll_create1(EPOLL_CLOEXEC);
        return m_epoll != -1;
    }

    void epoll_event_handler::set_timer(std::chrono::milliseconds delay) {
        if(delay.count() < 0) {
            m_timer.reset();
        } else {
            m_timer = clock_type::now() + delay;
        }
    }

    auto epoll_event_handler::watch(int fd, interest what) -> bool {
        if(what == interest::remove) {
            m_watched.erase(fd);
            // curl may already have closed the socket, which drops it from
            // the epoll set on its own.
            return epoll_ctl(m_epoll, EPOLL_CTL_DEL, fd, nullptr) == 0
                || errno == EBADF || errno == ENOENT;
        }

        auto ev = epoll_event{};
        ev.data.fd = fd;
        ev.events = EPOLLET;
        if(what != interest::out) {
            ev.events |= EPOLLIN;
        }
        if(what != interest::in) {
            ev.events |= EPOLLOUT;
        }
        auto op = EPOLL_CTL_MOD;
        if(m_watched.insert(fd).second) {
            op = EPOLL_CTL_ADD;
        }
        return epoll_ctl(m_epoll, op, fd, &ev) == 0;
    }

    auto epoll_event_handler::poll(std::chrono::milliseconds max_wait)
        -> std::optional<std::vector<event>> {
        auto wait = std::max(max_wait, std::chrono::milliseconds(0));
        if(m_timer.has_value()) {
            auto until_timer
                = std::chrono::duration_cast<std::chrono::milliseconds>(
                    m_timer.value() - clock_type::now());
            wait = std::clamp(until_timer, std::chrono::milliseconds(0), wait);
        }

        static constexpr auto max_events = 64;
        auto evs = std::array<epoll_event, max_events>();
        auto n = epoll_wait(m_epoll,
                            evs.data(),
                            max_events,
                            static_cast<int>(wait.count()));
        if(n == -1) {
            if(errno == EINTR) {
                return std::vector<event>();
            }
            return std::nullopt;
        }

        auto ret = std::vector<event>();
        if(m_timer.has_value() && clock_type::now() >= m_timer.value()) {
            m_timer.reset();
            ret.push_back(event{-1, true});
        }
        for(int i = 0; i < n; i++) {
            ret.push_back(event{evs[static_cast<size_t>(i)].data.fd, false});
        }
        return ret;
    }
}
