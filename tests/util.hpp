// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_TESTS_UTIL_H_
#define BRANCHNET_TESTS_UTIL_H_

#include "util/common/config.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace branchnet::test {
    /// Builds options for the given number of branches listening on
    /// consecutive localhost ports, with timeouts short enough for tests.
    /// Ledgers are placed in fresh directories named after the branches.
    /// \param n_branches number of branches.
    /// \param base_port port of the first branch.
    /// \return options struct.
    auto make_options(size_t n_branches, unsigned short base_port)
        -> config::options;

    /// Removes any leftover directory at the given path and returns the
    /// path.
    /// \param dir directory to clear.
    /// \return the path.
    auto fresh_dir(const std::string& dir) -> std::string;

    /// Removes the ledger directories of the given options.
    /// \param opts options naming the directories.
    void remove_dbs(const config::options& opts);

    /// Polls the given predicate until it returns true or the timeout
    /// expires.
    /// \param pred predicate to poll.
    /// \param timeout time bound.
    /// \return true if the predicate returned true in time.
    auto wait_for(const std::function<bool()>& pred,
                  std::chrono::milliseconds timeout
                  = std::chrono::milliseconds(5000)) -> bool;

    /// Loads the given config file into an options struct and asserts there
    /// was not an error.
    /// \param config_file path to config file to load and parse.
    /// \param opts reference to an options struct in which to place the
    ///             result.
    void load_config(const std::string& config_file, config::options& opts);
}

#endif // BRANCHNET_TESTS_UTIL_H_
