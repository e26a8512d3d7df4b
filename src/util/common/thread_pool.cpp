// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "thread_pool.hpp"

namespace branchnet {
    thread_pool::thread_pool(size_t max_threads)
        : m_max_threads(max_threads) {}

    thread_pool::~thread_pool() {
        {
            std::unique_lock l(m_mut);
            m_closing = true;
        }
        m_queue.close();
        // Running tasks may push follow-up tasks that spawn new workers
        for(;;) {
            auto threads = [&]() {
                std::unique_lock l(m_mut);
                return std::move(m_threads);
            }();
            if(threads.empty()) {
                break;
            }
            for(auto& t : threads) {
                if(t.joinable()) {
                    t.join();
                }
            }
        }
    }

    void thread_pool::push(std::function<void()> fn) {
        std::unique_lock l(m_mut);
        // Counted under m_mut, so a worker that has popped a task but not
        // yet claimed it still offsets that task here
        m_unclaimed++;
        m_queue.push(std::move(fn));
        // Idle workers exit once the queue is closed and empty
        if(!m_closing && m_unclaimed <= m_idle) {
            return;
        }
        if(m_max_threads != 0 && m_threads.size() >= m_max_threads) {
            return;
        }
        m_threads.emplace_back([this]() {
            thread_loop();
        });
    }

    auto thread_pool::size() -> size_t {
        std::unique_lock l(m_mut);
        return m_threads.size();
    }

    void thread_pool::thread_loop() {
        auto f = std::function<void()>();
        for(;;) {
            {
                std::unique_lock l(m_mut);
                m_idle++;
            }
            const auto popped = m_queue.pop(f);
            {
                std::unique_lock l(m_mut);
                m_idle--;
                if(popped) {
                    m_unclaimed--;
                }
            }
            if(!popped) {
                return;
            }
            f();
            f = nullptr;
        }
    }
}
