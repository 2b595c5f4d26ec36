// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "thread_pool.hpp"

#include <algorithm>

namespace codeproof {
    thread_pool::thread_pool(size_t n_threads) {
        auto n = std::max<size_t>(n_threads, 1);
        m_threads.reserve(n);
        for(size_t i = 0; i < n; i++) {
            m_threads.emplace_back([this]() {
                thread_loop();
            });
        }
    }

    thread_pool::~thread_pool() {
        m_queue.close();
        for(auto& t : m_threads) {
            if(t.joinable()) {
                t.join();
            }
        }
    }

    auto thread_pool::push(std::function<void()> fn) -> bool {
        return m_queue.push(std::move(fn));
    }

    auto thread_pool::size() const -> size_t {
        return m_threads.size();
    }

    void thread_pool::thread_loop() {
        auto f = std::function<void()>();
        while(m_queue.pop(f)) {
            f();
            f = nullptr;
        }
    }
}
