// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

TEST(thread_pool_test, runs_all_tasks) {
    std::atomic<int> ran{0};
    {
        auto pool = branchnet::thread_pool();
        for(int i{0}; i < 50; i++) {
            pool.push([&]() {
                ran++;
            });
        }
    }
    ASSERT_EQ(ran.load(), 50);
}

TEST(thread_pool_test, blocked_worker_does_not_starve_next_task) {
    // The second task is pushed while the only worker is taking the first
    // one off the queue. It must get a worker of its own.
    for(int i{0}; i < 200; i++) {
        auto released = std::make_shared<std::promise<void>>();
        auto done = released->get_future().share();
        std::atomic<bool> timed_out{false};
        {
            auto pool = branchnet::thread_pool();
            pool.push([&, done]() {
                if(done.wait_for(std::chrono::seconds(2))
                   != std::future_status::ready) {
                    timed_out = true;
                }
            });
            pool.push([released]() {
                released->set_value();
            });
        }
        ASSERT_FALSE(timed_out.load()) << "iteration " << i;
    }
}

TEST(thread_pool_test, max_threads_respected) {
    std::atomic<int> ran{0};
    auto pool = std::make_unique<branchnet::thread_pool>(2);
    for(int i{0}; i < 20; i++) {
        pool->push([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ran++;
        });
    }
    ASSERT_LE(pool->size(), 2U);
    pool.reset();
    ASSERT_EQ(ran.load(), 20);
}
