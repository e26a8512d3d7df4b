// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "branch/engine/engine.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

using branchnet::error;
using branchnet::error_code;
using branchnet::ledger::account;

class engine_test : public ::testing::Test {
  protected:
    void SetUp() override {
        branchnet::test::fresh_dir(m_db_dir);
        m_store = std::make_shared<branchnet::ledger::store>(m_logger);
        ASSERT_FALSE(m_store->open_db(m_db_dir).has_value());
        m_engine = std::make_shared<branchnet::engine::engine>("mumbai",
                                                               m_store,
                                                               m_logger);
        ASSERT_TRUE(m_engine->preload());
    }

    void TearDown() override {
        m_engine.reset();
        m_store.reset();
        branchnet::test::fresh_dir(m_db_dir);
    }

    auto balance_of(branchnet::ledger::account_no_t account_no)
        -> branchnet::ledger::amount_t {
        auto res = m_engine->balance(account_no);
        EXPECT_TRUE(std::holds_alternative<account>(res));
        return std::get<account>(res).m_balance;
    }

    std::shared_ptr<branchnet::logging::log> m_logger{
        std::make_shared<branchnet::logging::log>(
            branchnet::logging::log_level::warn)};
    std::shared_ptr<branchnet::ledger::store> m_store;
    std::shared_ptr<branchnet::engine::engine> m_engine;
    std::string m_db_dir{"engine_test_db"};
};

TEST_F(engine_test, preload_accounts) {
    auto accounts = m_engine->list_accounts();
    ASSERT_EQ(accounts.size(), branchnet::engine::preload_accounts.size());
    ASSERT_EQ(accounts[0].m_account_no, 1001U);
    ASSERT_EQ(accounts[0].m_name, "User_mumbai_1001");
    ASSERT_EQ(accounts[1].m_account_no, 1002U);
    ASSERT_EQ(accounts[1].m_balance, branchnet::engine::preload_balance);

    // A non-empty ledger is left alone.
    ASSERT_FALSE(std::holds_alternative<error>(m_engine->withdraw(1001, 1)));
    ASSERT_TRUE(m_engine->preload());
    ASSERT_EQ(balance_of(1001), 999);
}

TEST_F(engine_test, deposit_scenario) {
    auto res = m_engine->deposit(1001, 200);
    ASSERT_TRUE(std::holds_alternative<account>(res));
    ASSERT_EQ(std::get<account>(res).m_balance, 1200);
    ASSERT_EQ(balance_of(1001), 1200);
}

TEST_F(engine_test, overdraft_scenario) {
    auto res = m_engine->withdraw(1001, 1500);
    ASSERT_TRUE(std::holds_alternative<error>(res));
    ASSERT_EQ(std::get<error>(res).m_code, error_code::insufficient_funds);
    ASSERT_EQ(balance_of(1001), 1000);
}

TEST_F(engine_test, withdraw) {
    auto res = m_engine->withdraw(1002, 1000);
    ASSERT_TRUE(std::holds_alternative<account>(res));
    ASSERT_EQ(balance_of(1002), 0);
}

TEST_F(engine_test, unknown_account) {
    auto res = m_engine->balance(7);
    ASSERT_TRUE(std::holds_alternative<error>(res));
    ASSERT_EQ(std::get<error>(res).m_code, error_code::not_found);
}

TEST_F(engine_test, transfer_local) {
    auto res = m_engine->transfer_local(1001, 1002, 250);
    ASSERT_FALSE(std::holds_alternative<error>(res));
    ASSERT_EQ(balance_of(1001), 750);
    ASSERT_EQ(balance_of(1002), 1250);

    res = m_engine->transfer_local(1001, 1002, 751);
    ASSERT_TRUE(std::holds_alternative<error>(res));
    ASSERT_EQ(balance_of(1001) + balance_of(1002), 2000);
}

TEST_F(engine_test, create_account) {
    auto res = m_engine->create_account(2001, "Carol", 50);
    ASSERT_TRUE(std::holds_alternative<account>(res));
    ASSERT_EQ(balance_of(2001), 50);

    res = m_engine->create_account(2001, "Carol", 50);
    ASSERT_EQ(std::get<error>(res).m_code, error_code::account_exists);
    ASSERT_EQ(m_engine->list_accounts().size(), 3U);
}
