// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_COMMON_THREAD_POOL_H_
#define CODEPROOF_SRC_COMMON_THREAD_POOL_H_

#include "blocking_queue.hpp"

#include <functional>
#include <thread>
#include <vector>

namespace codeproof {
    /// Fixed-size pool of worker threads consuming a shared FIFO of jobs.
    /// At most n_threads jobs run at once; the rest wait in the queue.
    class thread_pool {
      public:
        /// Starts the worker threads.
        /// \param n_threads number of workers. Treated as 1 if zero.
        explicit thread_pool(size_t n_threads);

        /// Drops queued jobs that have not started and joins the workers
        /// once their current jobs return.
        ~thread_pool();

        thread_pool(const thread_pool&) = delete;
        auto operator=(const thread_pool&) -> thread_pool& = delete;
        thread_pool(thread_pool&&) = delete;
        auto operator=(thread_pool&&) -> thread_pool& = delete;

        /// Queues a job.
        /// \param fn job to run on a worker thread. Must not throw.
        /// \return false if the pool is shutting down.
        auto push(std::function<void()> fn) -> bool;

        /// Returns the number of worker threads.
        [[nodiscard]] auto size() const -> size_t;

      private:
        blocking_queue<std::function<void()>> m_queue;
        std::vector<std::thread> m_threads;

        void thread_loop();
    };
}

#endif // CODEPROOF_SRC_COMMON_THREAD_POOL_H_
