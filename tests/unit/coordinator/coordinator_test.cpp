// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "branch/coordinator/coordinator.hpp"
#include "branch/coordinator/format.hpp"
#include "branch/participant/participant.hpp"
#include "util.hpp"
#include "util/serialization/util.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using branchnet::error;
using branchnet::error_code;
using branchnet::coordinator::outcome;
using branchnet::ledger::account;
using branchnet::participant::tx_state;

namespace {
    /// Wraps a participant and injects failures and delays.
    class scripted_participant final
        : public branchnet::participant::interface {
      public:
        explicit scripted_participant(
            std::shared_ptr<branchnet::participant::interface> inner)
            : m_inner(std::move(inner)) {}

        auto prepare(const branchnet::participant::prepare_params& params)
            -> std::optional<error> override {
            m_prepares++;
            std::this_thread::sleep_for(m_prepare_delay);
            if(m_prepare_error.has_value()) {
                return m_prepare_error;
            }
            if(m_drop_prepare_reply) {
                // The prepare arrives but the connection drops before the
                // vote.
                auto err = m_inner->prepare(params);
                EXPECT_FALSE(err.has_value());
                return error{error_code::peer_unreachable, "Injected drop"};
            }
            return m_inner->prepare(params);
        }

        auto commit(const branchnet::ledger::tx_id_t& tx_id)
            -> std::optional<error> override {
            m_commits++;
            if(m_commit_failures > 0) {
                m_commit_failures--;
                // The commit arrives but its acknowledgement is lost.
                auto err = m_inner->commit(tx_id);
                EXPECT_FALSE(err.has_value());
                return error{error_code::timeout, "Injected timeout"};
            }
            return m_inner->commit(tx_id);
        }

        auto abort(const branchnet::ledger::tx_id_t& tx_id)
            -> std::optional<error> override {
            m_aborts++;
            if(m_abort_error.has_value()) {
                return m_abort_error;
            }
            return m_inner->abort(tx_id);
        }

        std::shared_ptr<branchnet::participant::interface> m_inner;
        std::chrono::milliseconds m_prepare_delay{0};
        std::optional<error> m_prepare_error;
        std::optional<error> m_abort_error;
        bool m_drop_prepare_reply{false};
        std::atomic<int> m_commit_failures{0};
        std::atomic<int> m_prepares{0};
        std::atomic<int> m_commits{0};
        std::atomic<int> m_aborts{0};
    };
}

class coordinator_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_opts.m_prepare_timeout_ms = 500;
        m_opts.m_commit_retry_attempts = 3;
        m_opts.m_commit_retry_initial_delay_ms = 10;
        m_opts.m_commit_retry_max_delay_ms = 40;
        m_opts.m_participant_deadline_ms = 10000;
        m_opts.m_participant_sweep_interval_ms = 60000;

        m_src_store = open_store(m_src_dir);
        m_dst_store = open_store(m_dst_dir);
        for(auto& s : {m_src_store, m_dst_store}) {
            ASSERT_TRUE(std::holds_alternative<account>(
                s->create_account(1001, "Alice", 1000)));
            ASSERT_TRUE(std::holds_alternative<account>(
                s->create_account(1002, "Bob", 300)));
        }

        m_engine = std::make_shared<branchnet::engine::engine>("mumbai",
                                                               m_src_store,
                                                               m_logger);
        m_src = std::make_shared<branchnet::participant::participant>(
            m_src_store,
            m_opts,
            m_logger);
        ASSERT_TRUE(m_src->init());
        m_dst = std::make_shared<branchnet::participant::participant>(
            m_dst_store,
            m_opts,
            m_logger);
        ASSERT_TRUE(m_dst->init());
        m_remote = std::make_shared<scripted_participant>(m_dst);
        m_coordinator = make_coordinator();
    }

    void TearDown() override {
        m_coordinator.reset();
        m_remote.reset();
        m_src.reset();
        m_dst.reset();
        m_engine.reset();
        m_src_store.reset();
        m_dst_store.reset();
        branchnet::test::fresh_dir(m_src_dir);
        branchnet::test::fresh_dir(m_dst_dir);
    }

    auto open_store(const std::string& dir)
        -> std::shared_ptr<branchnet::ledger::store> {
        branchnet::test::fresh_dir(dir);
        auto s = std::make_shared<branchnet::ledger::store>(m_logger);
        EXPECT_FALSE(s->open_db(dir).has_value());
        return s;
    }

    auto make_coordinator()
        -> std::unique_ptr<branchnet::coordinator::coordinator> {
        return std::make_unique<branchnet::coordinator::coordinator>(
            "mumbai",
            m_self,
            m_src_store,
            m_engine,
            m_src,
            [&](const branchnet::network::endpoint_t& ep)
                -> std::shared_ptr<branchnet::participant::interface> {
                if(ep == m_peer) {
                    return m_remote;
                }
                return nullptr;
            },
            m_opts,
            m_logger);
    }

    static auto balance(branchnet::ledger::store& s,
                        branchnet::ledger::account_no_t account_no)
        -> account {
        auto res = s.get(account_no);
        EXPECT_TRUE(std::holds_alternative<account>(res));
        return std::get<account>(res);
    }

    auto transfer(std::optional<std::string> tx_id = std::nullopt,
                  branchnet::ledger::amount_t amount = 500)
        -> branchnet::coordinator::result {
        return m_coordinator->execute(std::move(tx_id),
                                      1001,
                                      m_peer,
                                      1002,
                                      amount);
    }

    void expect_conserved() {
        auto total = balance(*m_src_store, 1001).m_balance
                   + balance(*m_src_store, 1002).m_balance
                   + balance(*m_dst_store, 1001).m_balance
                   + balance(*m_dst_store, 1002).m_balance;
        EXPECT_EQ(total, 2600);
    }

    std::shared_ptr<branchnet::logging::log> m_logger{
        std::make_shared<branchnet::logging::log>(
            branchnet::logging::log_level::warn)};
    branchnet::config::options m_opts;
    branchnet::network::endpoint_t m_self{"127.0.0.1", 5601};
    branchnet::network::endpoint_t m_peer{"127.0.0.1", 5602};
    std::string m_src_dir{"coordinator_test_src_db"};
    std::string m_dst_dir{"coordinator_test_dst_db"};
    std::shared_ptr<branchnet::ledger::store> m_src_store;
    std::shared_ptr<branchnet::ledger::store> m_dst_store;
    std::shared_ptr<branchnet::engine::engine> m_engine;
    std::shared_ptr<branchnet::participant::participant> m_src;
    std::shared_ptr<branchnet::participant::participant> m_dst;
    std::shared_ptr<scripted_participant> m_remote;
    std::unique_ptr<branchnet::coordinator::coordinator> m_coordinator;
};

TEST_F(coordinator_test, commit_both_sides) {
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::committed);
    ASSERT_FALSE(res.m_reason.has_value());
    ASSERT_EQ(res.m_tx_id.rfind("mumbai-", 0), 0U);

    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 500);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 800);
    ASSERT_EQ(m_src->state(res.m_tx_id), tx_state::committed);
    ASSERT_EQ(m_dst->state(res.m_tx_id), tx_state::committed);
    ASSERT_TRUE(m_src_store->scan_side("c/").empty());
    expect_conserved();
}

TEST_F(coordinator_test, destination_unreachable) {
    m_remote->m_prepare_error
        = error{error_code::peer_unreachable, "Injected"};
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::peer_unreachable);

    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 1000);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 300);
    ASSERT_EQ(m_src->state(res.m_tx_id), tx_state::aborted);
    ASSERT_EQ(m_remote->m_aborts.load(), 1);
    ASSERT_TRUE(m_src_store->scan_side("c/").empty());
}

TEST_F(coordinator_test, lost_prepare_reply_aborts_destination) {
    m_remote->m_drop_prepare_reply = true;
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::peer_unreachable);
    ASSERT_EQ(m_remote->m_aborts.load(), 1);
    ASSERT_EQ(m_dst->state(res.m_tx_id), tx_state::aborted);
    ASSERT_EQ(m_src->state(res.m_tx_id), tx_state::aborted);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 300);
    ASSERT_TRUE(m_src_store->scan_side("c/").empty());
}

TEST_F(coordinator_test, undeliverable_destination_abort_still_aborts) {
    m_remote->m_drop_prepare_reply = true;
    m_remote->m_abort_error
        = error{error_code::peer_unreachable, "Injected"};
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(m_remote->m_aborts.load(),
              static_cast<int>(m_opts.m_commit_retry_attempts));
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_TRUE(m_src_store->scan_side("c/").empty());
    ASSERT_TRUE(m_coordinator->list_unresolved().empty());
}

TEST_F(coordinator_test, unknown_destination_branch) {
    auto res = m_coordinator->execute(std::nullopt,
                                      1001,
                                      {"127.0.0.1", 5999},
                                      1002,
                                      100);
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::peer_unreachable);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_TRUE(m_src_store->scan_side("c/").empty());
}

TEST_F(coordinator_test, destination_refuses_unknown_account) {
    auto res = m_coordinator->execute(std::nullopt,
                                      1001,
                                      m_peer,
                                      4242,
                                      100);
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::not_found);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 1000);
}

TEST_F(coordinator_test, prepare_timeout_aborts_both) {
    m_remote->m_prepare_delay = std::chrono::milliseconds(800);
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::timeout);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 1000);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);

    // The late prepare finds the transfer already aborted.
    ASSERT_EQ(m_remote->m_aborts.load(), 1);
    m_coordinator.reset();
    ASSERT_EQ(m_dst->state(res.m_tx_id), tx_state::aborted);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 300);
}

TEST_F(coordinator_test, source_refusal_fails_fast) {
    m_opts.m_prepare_timeout_ms = 3000;
    m_coordinator = make_coordinator();
    m_remote->m_prepare_delay = std::chrono::milliseconds(1500);

    auto start = std::chrono::steady_clock::now();
    auto res = transfer(std::nullopt, 5000);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::insufficient_funds);
    ASSERT_LT(elapsed, std::chrono::milliseconds(1000));

    m_coordinator.reset();
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 300);
    ASSERT_EQ(m_dst->state(res.m_tx_id), tx_state::aborted);
}

TEST_F(coordinator_test, commit_retried_until_acknowledged) {
    m_remote->m_commit_failures = 2;
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::committed);
    ASSERT_EQ(m_remote->m_commits.load(), 3);
    // Retries never credit twice.
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 800);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 500);
    expect_conserved();
}

TEST_F(coordinator_test, unresolved_then_resolved) {
    m_remote->m_commit_failures = 10;
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::unresolved);
    ASSERT_EQ(res.m_reason->m_code, error_code::unresolved);
    ASSERT_EQ(m_remote->m_commits.load(), 3);

    auto unresolved = m_coordinator->list_unresolved();
    ASSERT_EQ(unresolved.size(), 1U);
    ASSERT_EQ(unresolved[0].m_tx_id, res.m_tx_id);
    ASSERT_EQ(unresolved[0].m_phase,
              branchnet::coordinator::tx_phase::committing);
    ASSERT_FALSE(unresolved[0].m_deliver_src);
    ASSERT_TRUE(unresolved[0].m_deliver_dst);
    ASSERT_EQ(unresolved[0].m_reason->m_code, error_code::timeout);

    m_remote->m_commit_failures = 0;
    auto resolved = m_coordinator->resolve_unresolved(res.m_tx_id);
    ASSERT_TRUE(
        std::holds_alternative<branchnet::coordinator::result>(resolved));
    ASSERT_EQ(std::get<branchnet::coordinator::result>(resolved).m_outcome,
              outcome::committed);
    ASSERT_TRUE(m_coordinator->list_unresolved().empty());
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 800);
    expect_conserved();

    auto again = m_coordinator->resolve_unresolved(res.m_tx_id);
    ASSERT_TRUE(std::holds_alternative<error>(again));
    ASSERT_EQ(std::get<error>(again).m_code, error_code::not_found);
}

TEST_F(coordinator_test, unresolved_survives_restart) {
    m_remote->m_commit_failures = 10;
    auto res = transfer();
    ASSERT_EQ(res.m_outcome, outcome::unresolved);

    m_coordinator = make_coordinator();
    ASSERT_EQ(m_coordinator->recover(), 0U);
    ASSERT_EQ(m_coordinator->list_unresolved().size(), 1U);
}

TEST_F(coordinator_test, same_branch_transfer) {
    auto res = m_coordinator->execute(std::nullopt, 1001, m_self, 1002, 250);
    ASSERT_EQ(res.m_outcome, outcome::committed);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 750);
    ASSERT_EQ(balance(*m_src_store, 1002).m_balance, 550);
    ASSERT_EQ(m_remote->m_prepares.load(), 0);

    res = m_coordinator->execute(std::nullopt, 1001, m_self, 1002, 5000);
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::insufficient_funds);
}

TEST_F(coordinator_test, host_alias_of_own_branch_stays_local) {
    auto alias = branchnet::network::endpoint_t{"localhost", m_self.second};
    auto res = m_coordinator->execute(std::nullopt, 1001, alias, 1002, 250);
    ASSERT_EQ(res.m_outcome, outcome::committed);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 750);
    ASSERT_EQ(balance(*m_src_store, 1002).m_balance, 550);
    ASSERT_EQ(m_remote->m_prepares.load(), 0);
    ASSERT_TRUE(m_src_store->scan_side("c/").empty());

    // Same host on another port is another branch.
    auto other = branchnet::network::endpoint_t{"localhost", 5999};
    res = m_coordinator->execute(std::nullopt, 1001, other, 1002, 100);
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::peer_unreachable);
}

TEST_F(coordinator_test, non_positive_amount) {
    auto res = transfer(std::nullopt, 0);
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::invalid_argument);
    ASSERT_EQ(m_remote->m_prepares.load(), 0);
}

TEST_F(coordinator_test, reused_transfer_id) {
    auto res = transfer(std::string("client-tx"));
    ASSERT_EQ(res.m_outcome, outcome::committed);
    ASSERT_EQ(res.m_tx_id, "client-tx");

    res = transfer(std::string("client-tx"));
    ASSERT_EQ(res.m_outcome, outcome::aborted);
    ASSERT_EQ(res.m_reason->m_code, error_code::protocol_violation);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 500);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 800);
    // Both sides stay committed.
    ASSERT_EQ(m_src->state("client-tx"), tx_state::committed);
    ASSERT_EQ(m_dst->state("client-tx"), tx_state::committed);
}

TEST_F(coordinator_test, recover_aborts_undecided) {
    auto params = branchnet::participant::prepare_params{
        "stranded",
        branchnet::participant::side::debit,
        1001,
        400};
    ASSERT_FALSE(m_src->prepare(params).has_value());
    auto rec = branchnet::coordinator::record{};
    rec.m_tx_id = "stranded";
    rec.m_src_account = 1001;
    rec.m_dst_endpoint = m_peer;
    rec.m_dst_account = 1002;
    rec.m_amount = 400;
    rec.m_phase = branchnet::coordinator::tx_phase::preparing;
    ASSERT_TRUE(m_src_store->put_side(
        branchnet::ledger::side_write{"c/stranded",
                                      branchnet::make_buffer(rec)}));

    m_coordinator = make_coordinator();
    ASSERT_EQ(m_coordinator->recover(), 1U);
    ASSERT_TRUE(branchnet::test::wait_for([&]() {
        return m_src_store->scan_side("c/").empty();
    }));
    ASSERT_EQ(m_src->state("stranded"), tx_state::aborted);
    ASSERT_EQ(m_dst->state("stranded"), tx_state::aborted);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
}

TEST_F(coordinator_test, recover_redelivers_commit) {
    auto debit = branchnet::participant::prepare_params{
        "decided",
        branchnet::participant::side::debit,
        1001,
        400};
    auto credit = debit;
    credit.m_side = branchnet::participant::side::credit;
    credit.m_account_no = 1002;
    ASSERT_FALSE(m_src->prepare(debit).has_value());
    ASSERT_FALSE(m_dst->prepare(credit).has_value());
    // The source commit landed before the restart.
    ASSERT_FALSE(m_src->commit("decided").has_value());

    auto rec = branchnet::coordinator::record{};
    rec.m_tx_id = "decided";
    rec.m_src_account = 1001;
    rec.m_dst_endpoint = m_peer;
    rec.m_dst_account = 1002;
    rec.m_amount = 400;
    rec.m_phase = branchnet::coordinator::tx_phase::committing;
    ASSERT_TRUE(m_src_store->put_side(
        branchnet::ledger::side_write{"c/decided",
                                      branchnet::make_buffer(rec)}));

    m_coordinator = make_coordinator();
    ASSERT_EQ(m_coordinator->recover(), 1U);
    ASSERT_TRUE(branchnet::test::wait_for([&]() {
        return m_src_store->scan_side("c/").empty();
    }));
    ASSERT_EQ(m_dst->state("decided"), tx_state::committed);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 600);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 700);
    expect_conserved();
}

TEST_F(coordinator_test, restart_after_commit_decision) {
    auto debit = branchnet::participant::prepare_params{
        "decided",
        branchnet::participant::side::debit,
        1001,
        500};
    auto credit = debit;
    credit.m_side = branchnet::participant::side::credit;
    credit.m_account_no = 1002;
    ASSERT_FALSE(m_src->prepare(debit).has_value());
    ASSERT_FALSE(m_dst->prepare(credit).has_value());

    // Crash after the commit decision was written, before any delivery.
    auto rec = branchnet::coordinator::record{};
    rec.m_tx_id = "decided";
    rec.m_src_account = 1001;
    rec.m_dst_endpoint = m_peer;
    rec.m_dst_account = 1002;
    rec.m_amount = 500;
    rec.m_phase = branchnet::coordinator::tx_phase::committing;
    ASSERT_TRUE(m_src_store->put_side(
        branchnet::ledger::side_write{"c/decided",
                                      branchnet::make_buffer(rec)}));

    // Restart in the controller's order under the abort policy.
    ASSERT_EQ(m_opts.m_participant_recovery,
              branchnet::config::recovery_policy::abort);
    m_coordinator.reset();
    m_src.reset();
    m_src = std::make_shared<branchnet::participant::participant>(
        m_src_store,
        m_opts,
        m_logger);
    m_coordinator = make_coordinator();
    auto pending = m_coordinator->decided_commits();
    ASSERT_EQ(pending.size(), 1U);
    ASSERT_EQ(pending.count("decided"), 1U);
    ASSERT_TRUE(m_src->init(pending));
    ASSERT_EQ(m_src->state("decided"), tx_state::prepared);

    ASSERT_EQ(m_coordinator->recover(), 1U);
    ASSERT_TRUE(branchnet::test::wait_for([&]() {
        return m_src_store->scan_side("c/").empty();
    }));
    ASSERT_EQ(m_src->state("decided"), tx_state::committed);
    ASSERT_EQ(m_dst->state("decided"), tx_state::committed);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance, 500);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance, 800);
    expect_conserved();
}

TEST_F(coordinator_test, restart_aborts_prepared_without_decision) {
    auto debit = branchnet::participant::prepare_params{
        "orphan",
        branchnet::participant::side::debit,
        1001,
        300};
    ASSERT_FALSE(m_src->prepare(debit).has_value());

    m_coordinator.reset();
    m_src.reset();
    m_src = std::make_shared<branchnet::participant::participant>(
        m_src_store,
        m_opts,
        m_logger);
    m_coordinator = make_coordinator();
    ASSERT_TRUE(m_coordinator->decided_commits().empty());
    ASSERT_TRUE(m_src->init(m_coordinator->decided_commits()));
    ASSERT_EQ(m_src->state("orphan"), tx_state::aborted);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
}

TEST_F(coordinator_test, concurrent_transfers_conserve_money) {
    constexpr auto n_transfers = 10;
    auto threads = std::vector<std::thread>();
    auto committed = std::atomic<int>{0};
    for(int i{0}; i < n_transfers; i++) {
        threads.emplace_back([&]() {
            auto res = transfer(std::nullopt, 100);
            if(res.m_outcome == outcome::committed) {
                committed++;
            } else {
                EXPECT_EQ(res.m_outcome, outcome::aborted);
            }
        });
    }
    for(auto& t : threads) {
        t.join();
    }
    ASSERT_GE(committed.load(), 1);
    ASSERT_EQ(balance(*m_src_store, 1001).m_balance,
              1000 - committed.load() * 100);
    ASSERT_EQ(balance(*m_src_store, 1001).m_reserved, 0);
    ASSERT_EQ(balance(*m_dst_store, 1002).m_balance,
              300 + committed.load() * 100);
    expect_conserved();
}

TEST_F(coordinator_test, generated_ids_unique) {
    auto a = m_coordinator->make_tx_id();
    auto b = m_coordinator->make_tx_id();
    ASSERT_NE(a, b);
    ASSERT_EQ(a.rfind("mumbai-", 0), 0U);
}
