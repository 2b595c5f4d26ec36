// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_COMMON_BLOCKING_QUEUE_H_
#define CODEPROOF_SRC_COMMON_BLOCKING_QUEUE_H_

#include <condition_variable>
#include <mutex>
#include <queue>

namespace codeproof {
    /// Thread-safe producer-consumer FIFO queue supporting multiple
    /// concurrent producers and consumers. Once closed, the queue rejects new
    /// items and wakes every waiting consumer.
    /// \tparam T type of object stored in the queue.
    template<typename T>
    class blocking_queue {
      public:
        blocking_queue() = default;

        blocking_queue(const blocking_queue&) = delete;
        auto operator=(const blocking_queue&) -> blocking_queue& = delete;

        blocking_queue(blocking_queue&&) = delete;
        auto operator=(blocking_queue&&) -> blocking_queue& = delete;

        /// \brief Destructor.
        ///
        /// Closes the queue and unblocks any waiting consumers.
        ~blocking_queue() {
            close();
        }

        /// Pushes an element onto the queue and notifies at most one waiting
        /// consumer.
        /// \param item object to push onto the queue.
        /// \return false if the queue has been closed.
        auto push(T item) -> bool {
            {
                std::unique_lock<std::mutex> lck(m_mut);
                if(m_closed) {
                    return false;
                }
                m_buffer.push(std::move(item));
            }
            m_cv.notify_one();
            return true;
        }

        /// \brief Pops an element from the queue.
        ///
        /// Blocks while the queue is empty and open.
        /// \param item object into which to move the popped element.
        /// \return true on success, false if the queue was closed.
        [[nodiscard]] auto pop(T& item) -> bool {
            std::unique_lock<std::mutex> lck(m_mut);
            m_cv.wait(lck, [&] {
                return m_closed || !m_buffer.empty();
            });
            if(m_closed) {
                return false;
            }
            item = std::move(m_buffer.front());
            m_buffer.pop();
            return true;
        }

        /// Drops any queued items, closes the queue and unblocks waiting
        /// consumers.
        void close() {
            {
                std::unique_lock<std::mutex> lck(m_mut);
                m_buffer = decltype(m_buffer)();
                m_closed = true;
            }
            m_cv.notify_all();
        }

        /// Returns the number of queued items.
        [[nodiscard]] auto size() -> size_t {
            std::unique_lock<std::mutex> lck(m_mut);
            return m_buffer.size();
        }

      private:
        std::queue<T> m_buffer;
        std::mutex m_mut;
        std::condition_variable m_cv;
        bool m_closed{false};
    };
}

#endif // CODEPROOF_SRC_COMMON_BLOCKING_QUEUE_H_
