// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "branch/participant/participant.hpp"
#include "util.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <thread>

using branchnet::error_code;
using branchnet::ledger::account;
using branchnet::participant::prepare_params;
using branchnet::participant::side;
using branchnet::participant::tx_state;

class participant_test : public ::testing::Test {
  protected:
    void SetUp() override {
        branchnet::test::fresh_dir(m_db_dir);
        m_opts.m_participant_deadline_ms = 10000;
        m_opts.m_participant_sweep_interval_ms = 60000;
        open();
        ASSERT_TRUE(std::holds_alternative<account>(
            m_store->create_account(1001, "Alice", 1000)));
        ASSERT_TRUE(std::holds_alternative<account>(
            m_store->create_account(1002, "Bob", 300)));
        start();
    }

    void TearDown() override {
        m_participant.reset();
        m_store.reset();
        branchnet::test::fresh_dir(m_db_dir);
    }

    void open() {
        m_store = std::make_shared<branchnet::ledger::store>(m_logger);
        ASSERT_FALSE(m_store->open_db(m_db_dir).has_value());
    }

    void start() {
        m_participant = std::make_unique<branchnet::participant::participant>(
            m_store,
            m_opts,
            m_logger);
        ASSERT_TRUE(m_participant->init());
    }

    void restart() {
        m_participant.reset();
        m_store.reset();
        open();
        start();
    }

    auto get(branchnet::ledger::account_no_t account_no) -> account {
        auto res = m_store->get(account_no);
        EXPECT_TRUE(std::holds_alternative<account>(res));
        return std::get<account>(res);
    }

    static auto code_of(const std::optional<branchnet::error>& err)
        -> std::optional<error_code> {
        if(err.has_value()) {
            return err->m_code;
        }
        return std::nullopt;
    }

    std::shared_ptr<branchnet::logging::log> m_logger{
        std::make_shared<branchnet::logging::log>(
            branchnet::logging::log_level::warn)};
    branchnet::config::options m_opts;
    std::shared_ptr<branchnet::ledger::store> m_store;
    std::unique_ptr<branchnet::participant::participant> m_participant;
    std::string m_db_dir{"participant_test_db"};

    prepare_params m_debit{"tx1", side::debit, 1001, 500};
    prepare_params m_credit{"tx1", side::credit, 1002, 500};
};

TEST_F(participant_test, debit_prepare_commit) {
    ASSERT_EQ(m_participant->state("tx1"), tx_state::idle);
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    ASSERT_EQ(m_participant->state("tx1"), tx_state::prepared);
    ASSERT_EQ(get(1001).m_reserved, 500);
    ASSERT_EQ(get(1001).m_balance, 1000);

    // A repeated prepare with the same parameters is acknowledged.
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());

    ASSERT_FALSE(m_participant->commit("tx1").has_value());
    ASSERT_EQ(m_participant->state("tx1"), tx_state::committed);
    ASSERT_EQ(get(1001).m_balance, 500);
    ASSERT_EQ(get(1001).m_reserved, 0);

    // Commit is idempotent and does not debit twice.
    ASSERT_FALSE(m_participant->commit("tx1").has_value());
    ASSERT_EQ(get(1001).m_balance, 500);

    ASSERT_EQ(code_of(m_participant->abort("tx1")),
              error_code::protocol_violation);
    ASSERT_EQ(code_of(m_participant->prepare(m_debit)),
              error_code::protocol_violation);
}

TEST_F(participant_test, credit_prepare_commit) {
    ASSERT_FALSE(m_participant->prepare(m_credit).has_value());
    ASSERT_EQ(get(1002).m_balance, 300);
    ASSERT_FALSE(get(1002).m_reserved_by.has_value());

    ASSERT_FALSE(m_participant->commit("tx1").has_value());
    ASSERT_EQ(get(1002).m_balance, 800);
    ASSERT_FALSE(m_participant->commit("tx1").has_value());
    ASSERT_EQ(get(1002).m_balance, 800);
}

TEST_F(participant_test, prepare_refusals) {
    auto big = prepare_params{"tx2", side::debit, 1001, 1001};
    ASSERT_EQ(code_of(m_participant->prepare(big)),
              error_code::insufficient_funds);
    ASSERT_EQ(m_participant->state("tx2"), tx_state::idle);

    auto missing = prepare_params{"tx3", side::credit, 4242, 10};
    ASSERT_EQ(code_of(m_participant->prepare(missing)),
              error_code::not_found);
    ASSERT_EQ(m_participant->state("tx3"), tx_state::idle);

    auto zero = prepare_params{"tx4", side::debit, 1001, 0};
    ASSERT_EQ(code_of(m_participant->prepare(zero)),
              error_code::invalid_argument);

    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    auto other_amount = m_debit;
    other_amount.m_amount = 400;
    ASSERT_EQ(code_of(m_participant->prepare(other_amount)),
              error_code::protocol_violation);

    // A second transfer on the reserved account conflicts.
    auto second = prepare_params{"tx5", side::debit, 1001, 100};
    ASSERT_EQ(code_of(m_participant->prepare(second)),
              error_code::tx_conflict);
}

TEST_F(participant_test, credit_refused_when_balance_would_overflow) {
    constexpr auto max_amount
        = std::numeric_limits<branchnet::ledger::amount_t>::max();
    auto huge = prepare_params{"tx6", side::credit, 1002, max_amount - 299};
    ASSERT_EQ(code_of(m_participant->prepare(huge)),
              error_code::invalid_argument);
    ASSERT_EQ(m_participant->state("tx6"), tx_state::idle);
    ASSERT_EQ(get(1002).m_balance, 300);

    auto fits = prepare_params{"tx7", side::credit, 1002, max_amount - 300};
    ASSERT_FALSE(m_participant->prepare(fits).has_value());
    ASSERT_FALSE(m_participant->commit("tx7").has_value());
    ASSERT_EQ(get(1002).m_balance, max_amount);
}

TEST_F(participant_test, abort_prepared_debit) {
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    ASSERT_FALSE(m_participant->abort("tx1").has_value());
    ASSERT_EQ(m_participant->state("tx1"), tx_state::aborted);
    ASSERT_EQ(get(1001).m_balance, 1000);
    ASSERT_EQ(get(1001).m_reserved, 0);

    ASSERT_FALSE(m_participant->abort("tx1").has_value());
    ASSERT_EQ(code_of(m_participant->commit("tx1")),
              error_code::protocol_violation);
    ASSERT_EQ(get(1001).m_balance, 1000);
}

TEST_F(participant_test, abort_before_prepare) {
    ASSERT_FALSE(m_participant->abort("tx1").has_value());
    ASSERT_EQ(m_participant->state("tx1"), tx_state::aborted);
    ASSERT_EQ(code_of(m_participant->prepare(m_debit)),
              error_code::protocol_violation);
    ASSERT_EQ(get(1001).m_reserved, 0);
}

TEST_F(participant_test, commit_unknown) {
    ASSERT_EQ(code_of(m_participant->commit("nope")),
              error_code::protocol_violation);
    ASSERT_EQ(m_participant->state("nope"), tx_state::idle);
}

TEST_F(participant_test, deadline_abort) {
    m_opts.m_participant_deadline_ms = 50;
    restart();
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    ASSERT_EQ(m_participant->sweep(), 0U);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(m_participant->sweep(), 1U);
    ASSERT_EQ(m_participant->state("tx1"), tx_state::aborted);
    ASSERT_EQ(get(1001).m_reserved, 0);
    ASSERT_EQ(code_of(m_participant->commit("tx1")),
              error_code::protocol_violation);
}

TEST_F(participant_test, sweeper_thread_aborts) {
    m_opts.m_participant_deadline_ms = 50;
    m_opts.m_participant_sweep_interval_ms = 20;
    restart();
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    ASSERT_TRUE(branchnet::test::wait_for([&]() {
        return m_participant->state("tx1") == tx_state::aborted;
    }));
    ASSERT_EQ(get(1001).m_reserved, 0);
}

TEST_F(participant_test, resolved_records_forgotten) {
    m_opts.m_resolved_retention_ms = 0;
    restart();
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    ASSERT_FALSE(m_participant->commit("tx1").has_value());
    ASSERT_EQ(m_participant->sweep(), 0U);
    ASSERT_EQ(m_participant->state("tx1"), tx_state::idle);
    ASSERT_TRUE(m_store->scan_side("p/").empty());
}

TEST_F(participant_test, restart_aborts_prepared) {
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());
    auto committed = prepare_params{"tx2", side::credit, 1002, 50};
    ASSERT_FALSE(m_participant->prepare(committed).has_value());
    ASSERT_FALSE(m_participant->commit("tx2").has_value());

    restart();
    ASSERT_EQ(m_participant->state("tx1"), tx_state::aborted);
    ASSERT_EQ(get(1001).m_reserved, 0);
    ASSERT_EQ(get(1001).m_balance, 1000);
    ASSERT_EQ(m_participant->state("tx2"), tx_state::committed);
    ASSERT_FALSE(m_participant->commit("tx2").has_value());
    ASSERT_EQ(get(1002).m_balance, 350);
}

TEST_F(participant_test, restart_holds_prepared) {
    m_opts.m_participant_recovery = branchnet::config::recovery_policy::hold;
    restart();
    ASSERT_FALSE(m_participant->prepare(m_debit).has_value());

    restart();
    ASSERT_EQ(m_participant->state("tx1"), tx_state::prepared);
    ASSERT_EQ(get(1001).m_reserved, 500);
    ASSERT_FALSE(m_participant->commit("tx1").has_value());
    ASSERT_EQ(get(1001).m_balance, 500);
}
