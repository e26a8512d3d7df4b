// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_COMMON_THREAD_POOL_H_
#define BRANCHNET_SRC_UTIL_COMMON_THREAD_POOL_H_

#include "blocking_queue.hpp"

#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace branchnet {
    /// Pool of worker threads consuming a shared task queue. Workers are
    /// spawned lazily whenever a task is pushed and no idle worker is
    /// available, up to an optional limit.
    class thread_pool {
      public:
        /// Constructor.
        /// \param max_threads maximum number of workers. Zero means no
        ///                    limit.
        explicit thread_pool(size_t max_threads = 0);

        /// Runs the tasks still queued, including tasks they push, then
        /// joins all workers.
        ~thread_pool();

        thread_pool(const thread_pool&) = delete;
        auto operator=(const thread_pool&) -> thread_pool& = delete;
        thread_pool(thread_pool&&) = delete;
        auto operator=(thread_pool&&) -> thread_pool& = delete;

        /// Queues a task for execution on a worker thread.
        /// \param fn task to run.
        void push(std::function<void()> fn);

        /// Returns the number of workers spawned so far.
        /// \return worker count.
        [[nodiscard]] auto size() -> size_t;

      private:
        size_t m_max_threads;
        blocking_queue<std::function<void()>> m_queue;
        std::mutex m_mut;
        std::vector<std::thread> m_threads;
        size_t m_idle{0};
        /// Tasks pushed but not yet taken by a worker.
        size_t m_unclaimed{0};
        bool m_closing{false};

        void thread_loop();
    };
}

#endif // BRANCHNET_SRC_UTIL_COMMON_THREAD_POOL_H_
