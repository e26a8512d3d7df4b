// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_COMMON_BLOCKING_QUEUE_H_
#define BRANCHNET_SRC_UTIL_COMMON_BLOCKING_QUEUE_H_

#include <condition_variable>
#include <deque>
#include <mutex>

namespace branchnet {
    /// FIFO queue shared between producer and consumer threads. Once
    /// closed, consumers drain what is left and then stop blocking.
    /// \tparam T element type.
    template<typename T>
    class blocking_queue {
      public:
        blocking_queue() = default;

        blocking_queue(const blocking_queue&) = delete;
        auto operator=(const blocking_queue&) -> blocking_queue& = delete;

        blocking_queue(blocking_queue&&) = delete;
        auto operator=(blocking_queue&&) -> blocking_queue& = delete;

        ~blocking_queue() {
            clear();
        }

        /// Appends an element and wakes one consumer. Elements pushed after
        /// close are still delivered to consumers that have not stopped.
        /// \param item element to append.
        /// \return queue length after the push.
        auto push(T item) -> size_t {
            size_t len{0};
            {
                std::lock_guard<std::mutex> l(m_mut);
                m_items.push_back(std::move(item));
                len = m_items.size();
            }
            m_cv.notify_one();
            return len;
        }

        /// Takes the oldest element, waiting while the queue is empty and
        /// open.
        /// \param item receives the element.
        /// \return false if the queue is closed and empty.
        [[nodiscard]] auto pop(T& item) -> bool {
            std::unique_lock<std::mutex> l(m_mut);
            m_cv.wait(l, [&] {
                return m_closed || !m_items.empty();
            });
            if(m_items.empty()) {
                return false;
            }
            item = std::move(m_items.front());
            m_items.pop_front();
            return true;
        }

        /// Closes the queue. Pending elements remain poppable.
        void close() {
            {
                std::lock_guard<std::mutex> l(m_mut);
                m_closed = true;
            }
            m_cv.notify_all();
        }

        /// Closes the queue and discards pending elements.
        void clear() {
            {
                std::lock_guard<std::mutex> l(m_mut);
                m_closed = true;
                m_items.clear();
            }
            m_cv.notify_all();
        }

      private:
        std::deque<T> m_items;
        std::mutex m_mut;
        std::condition_variable m_cv;
        bool m_closed{false};
    };
}

#endif // BRANCHNET_SRC_UTIL_COMMON_BLOCKING_QUEUE_H_
