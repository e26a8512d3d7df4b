// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "participant.hpp"

#include "format.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

namespace branchnet::participant {
    namespace {
        constexpr auto record_prefix = "p/";

        auto violation(const std::string& msg) -> error {
            return error{error_code::protocol_violation, msg};
        }

        auto ledger_error(const ledger::store::account_result& res)
            -> std::optional<error> {
            if(const auto* err = std::get_if<error>(&res)) {
                return *err;
            }
            return std::nullopt;
        }
    }

    auto now_ms() -> uint64_t {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count());
    }

    participant::participant(std::shared_ptr<ledger::store> store,
                             const config::options& opts,
                             std::shared_ptr<logging::log> logger)
        : m_store(std::move(store)),
          m_logger(std::move(logger)),
          m_deadline(opts.m_participant_deadline_ms),
          m_sweep_interval(opts.m_participant_sweep_interval_ms),
          m_recovery(opts.m_participant_recovery),
          m_retention(opts.m_resolved_retention_ms) {}

    participant::~participant() {
        stop();
    }

    auto participant::init(
        const std::unordered_set<ledger::tx_id_t>& committing) -> bool {
        auto held = size_t{};
        for(auto& [key, val] : m_store->scan_side(record_prefix)) {
            auto rec = from_buffer<record>(val);
            if(!rec.has_value()) {
                m_logger->fatal("Unreadable participant record", key);
            }
            auto tx_id = key.substr(std::string(record_prefix).size());
            auto e = std::make_shared<entry>();
            e->m_record = rec;
            if(rec->m_state == tx_state::prepared) {
                if(committing.count(tx_id) != 0) {
                    m_logger->info("Keeping transfer",
                                   tx_id,
                                   "prepared, its commit is pending");
                    e->m_commit_pending = true;
                    held++;
                } else if(m_recovery == config::recovery_policy::abort) {
                    m_logger->warn("Aborting transfer",
                                   tx_id,
                                   "left prepared before restart");
                    auto err = abort_prepared(tx_id, *e);
                    if(err.has_value()) {
                        m_logger->error("Recovery abort of",
                                        tx_id,
                                        "failed:",
                                        err->m_message);
                        return false;
                    }
                } else {
                    held++;
                }
            }
            m_entries.emplace(std::move(tx_id), std::move(e));
        }
        m_logger->info("Participant loaded",
                       m_entries.size(),
                       "transfer records,",
                       held,
                       "held prepared");

        {
            std::unique_lock<std::mutex> l(m_sweep_mut);
            m_running = true;
        }
        m_sweep_thread = std::thread([&]() {
            sweep_loop();
        });
        return true;
    }

    void participant::stop() {
        {
            std::unique_lock<std::mutex> l(m_sweep_mut);
            m_running = false;
        }
        m_sweep_cv.notify_all();
        if(m_sweep_thread.joinable()) {
            m_sweep_thread.join();
        }
    }

    auto participant::prepare(const prepare_params& params)
        -> std::optional<error> {
        if(params.m_amount <= 0) {
            return error{error_code::invalid_argument,
                         "Amount must be positive"};
        }
        auto [e, l] = acquire(params.m_tx_id);
        if(e->m_record.has_value()) {
            const auto& rec = e->m_record.value();
            if(rec.m_state != tx_state::prepared) {
                return violation("Transfer " + params.m_tx_id
                                 + " is already resolved");
            }
            if(rec.m_side != params.m_side
               || rec.m_account_no != params.m_account_no
               || rec.m_amount != params.m_amount) {
                return violation("Transfer " + params.m_tx_id
                                 + " was prepared with other parameters");
            }
            return std::nullopt;
        }

        const auto deadline
            = now_ms() + static_cast<uint64_t>(m_deadline.count());
        auto rec = record{params.m_side,
                          params.m_account_no,
                          params.m_amount,
                          tx_state::prepared,
                          deadline,
                          0};
        auto res = [&]() {
            if(params.m_side == side::debit) {
                return m_store->reserve(params.m_account_no,
                                        params.m_amount,
                                        params.m_tx_id,
                                        write_of(params.m_tx_id, rec));
            }
            return m_store->note(params.m_account_no,
                                 params.m_amount,
                                 params.m_tx_id,
                                 ledger::op_kind::transfer_prepare,
                                 write_of(params.m_tx_id, rec));
        }();
        if(auto err = ledger_error(res)) {
            m_logger->info("Refused to prepare",
                           params.m_tx_id,
                           "for account",
                           params.m_account_no,
                           ":",
                           to_string(err->m_code));
            remove(params.m_tx_id, e);
            return err;
        }

        e->m_record = rec;
        m_logger->info("Prepared",
                       params.m_tx_id,
                       params.m_side == side::debit ? "debit" : "credit",
                       "of",
                       params.m_amount,
                       "on account",
                       params.m_account_no);
        return std::nullopt;
    }

    auto participant::commit(const ledger::tx_id_t& tx_id)
        -> std::optional<error> {
        auto [e, l] = acquire(tx_id);
        if(!e->m_record.has_value()) {
            remove(tx_id, e);
            return violation("Commit for unknown transfer " + tx_id);
        }
        auto rec = e->m_record.value();
        if(rec.m_state == tx_state::committed) {
            return std::nullopt;
        }
        if(rec.m_state == tx_state::aborted) {
            return violation("Commit for aborted transfer " + tx_id);
        }

        rec.m_state = tx_state::committed;
        rec.m_resolved_at = now_ms();
        auto res = [&]() {
            if(rec.m_side == side::debit) {
                return m_store->apply_debit(rec.m_account_no,
                                            rec.m_amount,
                                            tx_id,
                                            write_of(tx_id, rec));
            }
            return m_store->apply_credit(rec.m_account_no,
                                         rec.m_amount,
                                         tx_id,
                                         write_of(tx_id, rec));
        }();
        if(auto err = ledger_error(res)) {
            m_logger->error("Failed to commit",
                            tx_id,
                            ":",
                            to_string(err->m_code),
                            err->m_message);
            return err;
        }

        e->m_record = rec;
        m_logger->info("Committed", tx_id);
        return std::nullopt;
    }

    auto participant::abort(const ledger::tx_id_t& tx_id)
        -> std::optional<error> {
        auto [e, l] = acquire(tx_id);
        if(!e->m_record.has_value()) {
            auto rec = record{side::debit,
                              0,
                              0,
                              tx_state::aborted,
                              0,
                              now_ms()};
            if(!m_store->put_side(write_of(tx_id, rec))) {
                remove(tx_id, e);
                return error{error_code::storage_failure,
                             "Failed to record abort of " + tx_id};
            }
            e->m_record = rec;
            m_logger->info("Aborted unknown transfer", tx_id);
            return std::nullopt;
        }
        switch(e->m_record->m_state) {
            case tx_state::aborted:
                return std::nullopt;
            case tx_state::committed:
                return violation("Abort for committed transfer " + tx_id);
            default:
                break;
        }
        auto err = abort_prepared(tx_id, *e);
        if(!err.has_value()) {
            m_logger->info("Aborted", tx_id);
        }
        return err;
    }

    auto participant::state(const ledger::tx_id_t& tx_id) -> tx_state {
        auto [e, l] = acquire(tx_id);
        if(!e->m_record.has_value()) {
            remove(tx_id, e);
            return tx_state::idle;
        }
        return e->m_record->m_state;
    }

    auto participant::sweep() -> size_t {
        auto entries = [&]() {
            std::unique_lock<std::mutex> l(m_entries_mut);
            return m_entries;
        }();

        const auto now = now_ms();
        const auto retention = static_cast<uint64_t>(m_retention.count());
        size_t aborted{0};
        for(auto& [tx_id, e] : entries) {
            std::unique_lock<std::mutex> l(e->m_mut);
            if(e->m_removed || !e->m_record.has_value()) {
                continue;
            }
            const auto& rec = e->m_record.value();
            if(rec.m_state == tx_state::prepared) {
                if(rec.m_deadline > now || e->m_commit_pending) {
                    continue;
                }
                m_logger->warn("Deadline passed for prepared transfer",
                               tx_id,
                               ", aborting");
                if(auto err = abort_prepared(tx_id, *e)) {
                    m_logger->error("Deadline abort of",
                                    tx_id,
                                    "failed:",
                                    err->m_message);
                    continue;
                }
                aborted++;
            } else if(rec.m_resolved_at + retention <= now) {
                auto erase
                    = ledger::side_write{record_key(tx_id), std::nullopt};
                if(!m_store->put_side(erase)) {
                    continue;
                }
                remove(tx_id, e);
                m_logger->debug("Forgot resolved transfer", tx_id);
            }
        }
        return aborted;
    }

    auto participant::acquire(const ledger::tx_id_t& tx_id)
        -> std::pair<std::shared_ptr<entry>, std::unique_lock<std::mutex>> {
        while(true) {
            auto e = [&]() {
                std::unique_lock<std::mutex> l(m_entries_mut);
                auto& it = m_entries[tx_id];
                if(!it) {
                    it = std::make_shared<entry>();
                }
                return it;
            }();
            auto l = std::unique_lock<std::mutex>(e->m_mut);
            if(!e->m_removed) {
                return {std::move(e), std::move(l)};
            }
        }
    }

    void participant::remove(const ledger::tx_id_t& tx_id,
                             const std::shared_ptr<entry>& e) {
        e->m_removed = true;
        std::unique_lock<std::mutex> l(m_entries_mut);
        auto it = m_entries.find(tx_id);
        if(it != m_entries.end() && it->second == e) {
            m_entries.erase(it);
        }
    }

    auto participant::abort_prepared(const ledger::tx_id_t& tx_id, entry& e)
        -> std::optional<error> {
        auto rec = e.m_record.value();
        rec.m_state = tx_state::aborted;
        rec.m_resolved_at = now_ms();
        auto res = [&]() {
            if(rec.m_side == side::debit) {
                return m_store->release(rec.m_account_no,
                                        tx_id,
                                        write_of(tx_id, rec));
            }
            return m_store->note(rec.m_account_no,
                                 rec.m_amount,
                                 tx_id,
                                 ledger::op_kind::transfer_abort,
                                 write_of(tx_id, rec));
        }();
        if(auto err = ledger_error(res)) {
            return err;
        }
        e.m_record = rec;
        return std::nullopt;
    }

    auto participant::record_key(const ledger::tx_id_t& tx_id)
        -> std::string {
        return record_prefix + tx_id;
    }

    auto participant::write_of(const ledger::tx_id_t& tx_id, const record& r)
        -> ledger::side_write {
        return ledger::side_write{record_key(tx_id), make_buffer(r)};
    }

    void participant::sweep_loop() {
        std::unique_lock<std::mutex> l(m_sweep_mut);
        while(m_running) {
            m_sweep_cv.wait_for(l, m_sweep_interval);
            if(!m_running) {
                break;
            }
            l.unlock();
            sweep();
            l.lock();
        }
    }
}
