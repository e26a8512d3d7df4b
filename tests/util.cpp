// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include <array>
#include <filesystem>
#include <gtest/gtest.h>
#include <thread>

namespace branchnet::test {
    auto make_options(size_t n_branches, unsigned short base_port)
        -> config::options {
        static constexpr auto names
            = std::array<const char*, 4>{"mumbai", "delhi", "pune", "goa"};
        auto opts = config::options{};
        for(size_t i{0}; i < n_branches; i++) {
            auto name = i < names.size() ? std::string(names[i])
                                         : "branch" + std::to_string(i);
            opts.m_branch_names.push_back(name);
            opts.m_branch_endpoints.emplace_back(
                network::localhost,
                static_cast<unsigned short>(base_port + i));
            opts.m_branch_db_dirs.push_back(fresh_dir(name + "_test_db"));
            opts.m_branch_loglevels.push_back(logging::log_level::warn);
            opts.m_branch_preload.push_back(true);
        }
        opts.m_prepare_timeout_ms = 500;
        opts.m_commit_retry_attempts = 3;
        opts.m_commit_retry_initial_delay_ms = 20;
        opts.m_commit_retry_max_delay_ms = 100;
        opts.m_rpc_call_timeout_ms = 300;
        opts.m_participant_deadline_ms = 10000;
        opts.m_participant_sweep_interval_ms = 50;
        opts.m_server_threads = 4;
        return opts;
    }

    auto fresh_dir(const std::string& dir) -> std::string {
        std::filesystem::remove_all(dir);
        return dir;
    }

    void remove_dbs(const config::options& opts) {
        for(const auto& dir : opts.m_branch_db_dirs) {
            std::filesystem::remove_all(dir);
        }
    }

    auto wait_for(const std::function<bool()>& pred,
                  std::chrono::milliseconds timeout) -> bool {
        static constexpr auto poll_interval = std::chrono::milliseconds(10);
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while(std::chrono::steady_clock::now() < deadline) {
            if(pred()) {
                return true;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return pred();
    }

    void load_config(const std::string& config_file, config::options& opts) {
        auto opts_or_err = config::load_options(config_file);
        ASSERT_TRUE(std::holds_alternative<config::options>(opts_or_err));
        opts = std::get<config::options>(opts_or_err);
    }
}
