// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "controller.hpp"
#include "util/common/config.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

// LCOV_EXCL_START
auto main(int argc, char** argv) -> int {
    auto args = branchnet::config::get_args(argc, argv);
    if(args.size() < 3) {
        std::cout << "Usage: " << args[0] << " <config file> <branch index>"
                  << std::endl;
        return 0;
    }

    auto cfg_or_err = branchnet::config::load_options(args[1]);
    if(std::holds_alternative<std::string>(cfg_or_err)) {
        std::cerr << "Error loading config file: "
                  << std::get<std::string>(cfg_or_err) << std::endl;
        return -1;
    }
    auto opts = std::get<branchnet::config::options>(cfg_or_err);

    auto branch_id = std::stoull(args[2]);
    if(opts.m_branch_names.size() <= branch_id) {
        std::cerr << "Branch index not configured" << std::endl;
        return -1;
    }

    auto logger = std::make_shared<branchnet::logging::log>(
        opts.m_branch_loglevels[branch_id],
        opts.m_branch_names[branch_id]);

    auto branch = branchnet::branch::controller(branch_id, opts, logger);
    if(!branch.init()) {
        logger->fatal("Failed to start branch");
    }

    static std::atomic_bool running{true};

    // Wait for CTRL+C etc
    std::signal(SIGINT, [](int /* sig */) {
        running = false;
    });
    std::signal(SIGTERM, [](int /* sig */) {
        running = false;
    });

    logger->info("Branch running...");

    while(running) {
        static constexpr auto running_check_delay
            = std::chrono::milliseconds(1000);
        std::this_thread::sleep_for(running_check_delay);
    }

    logger->info("Shutting down...");

    branch.quit();

    return 0;
}
// LCOV_EXCL_STOP
