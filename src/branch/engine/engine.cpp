// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "engine.hpp"

namespace branchnet::engine {
    engine::engine(std::string branch_name,
                   std::shared_ptr<ledger::store> store,
                   std::shared_ptr<logging::log> logger)
        : m_branch_name(std::move(branch_name)),
          m_store(std::move(store)),
          m_logger(std::move(logger)) {}

    auto engine::balance(ledger::account_no_t account_no)
        -> ledger::store::account_result {
        return m_store->get(account_no);
    }

    auto engine::deposit(ledger::account_no_t account_no,
                         ledger::amount_t amount)
        -> ledger::store::account_result {
        auto res = m_store->apply_credit(account_no, amount);
        log_result("Deposit of " + std::to_string(amount) + " to "
                       + std::to_string(account_no),
                   res);
        return res;
    }

    auto engine::withdraw(ledger::account_no_t account_no,
                          ledger::amount_t amount)
        -> ledger::store::account_result {
        auto res = m_store->withdraw(account_no, amount);
        log_result("Withdrawal of " + std::to_string(amount) + " from "
                       + std::to_string(account_no),
                   res);
        return res;
    }

    auto engine::transfer_local(ledger::account_no_t src_account,
                                ledger::account_no_t dst_account,
                                ledger::amount_t amount)
        -> ledger::store::pair_result {
        auto res = m_store->transfer(src_account, dst_account, amount);
        if(auto* err = std::get_if<error>(&res)) {
            m_logger->warn("Local transfer of",
                           amount,
                           "from",
                           src_account,
                           "to",
                           dst_account,
                           "failed:",
                           to_string(err->m_code),
                           err->m_message);
        } else {
            m_logger->info("Local transfer of",
                           amount,
                           "from",
                           src_account,
                           "to",
                           dst_account,
                           "done");
        }
        return res;
    }

    auto engine::list_accounts() -> std::vector<ledger::account> {
        return m_store->list_accounts();
    }

    auto engine::create_account(ledger::account_no_t account_no,
                                std::string name,
                                ledger::amount_t balance)
        -> ledger::store::account_result {
        auto res
            = m_store->create_account(account_no, std::move(name), balance);
        log_result("Opening account " + std::to_string(account_no), res);
        return res;
    }

    auto engine::preload() -> bool {
        if(!m_store->empty()) {
            return true;
        }
        for(const auto account_no : preload_accounts) {
            auto name = "User_" + m_branch_name + "_"
                      + std::to_string(account_no);
            auto res = create_account(account_no, name, preload_balance);
            if(std::holds_alternative<error>(res)) {
                return false;
            }
        }
        m_logger->info("Preloaded", preload_accounts.size(), "accounts");
        return true;
    }

    void engine::log_result(const std::string& op,
                            const ledger::store::account_result& res) {
        if(const auto* err = std::get_if<error>(&res)) {
            m_logger->warn(op,
                           "failed:",
                           to_string(err->m_code),
                           err->m_message);
            return;
        }
        const auto& acc = std::get<ledger::account>(res);
        m_logger->info(op, "done, balance", acc.m_balance);
    }
}
