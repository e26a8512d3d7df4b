// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "coordinator.hpp"

#include "format.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

#include <array>
#include <future>

namespace branchnet::coordinator {
    namespace {
        constexpr auto record_prefix = "c/";

        /// Delivery failures worth retrying. Everything else is a definite
        /// answer from the participant.
        auto is_transient(error_code code) -> bool {
            return code == error_code::timeout
                || code == error_code::peer_unreachable
                || code == error_code::storage_failure;
        }

        auto now_ms() -> uint64_t {
            return static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count());
        }
    }

    coordinator::coordinator(std::string branch_name,
                             network::endpoint_t self_endpoint,
                             std::shared_ptr<ledger::store> store,
                             std::shared_ptr<engine::engine> eng,
                             std::shared_ptr<participant::interface> local,
                             participant_factory remote_participants,
                             const config::options& opts,
                             std::shared_ptr<logging::log> logger)
        : m_branch_name(std::move(branch_name)),
          m_self_endpoint(std::move(self_endpoint)),
          m_store(std::move(store)),
          m_engine(std::move(eng)),
          m_local(std::move(local)),
          m_remote_participants(std::move(remote_participants)),
          m_logger(std::move(logger)),
          m_prepare_timeout(opts.m_prepare_timeout_ms),
          m_retry_attempts(opts.m_commit_retry_attempts),
          m_retry_initial_delay(opts.m_commit_retry_initial_delay_ms),
          m_retry_max_delay(opts.m_commit_retry_max_delay_ms),
          m_rng(std::random_device{}()) {}

    coordinator::~coordinator() {
        stop();
    }

    void coordinator::stop() {
        {
            std::unique_lock<std::mutex> l(m_stop_mut);
            m_running = false;
        }
        m_stop_cv.notify_all();
    }

    auto coordinator::make_tx_id() -> ledger::tx_id_t {
        auto rnd = [&]() {
            std::unique_lock<std::mutex> l(m_rng_mut);
            return std::uniform_int_distribution<uint32_t>()(m_rng);
        }();
        const auto suffix = make_buffer(rnd);
        return m_branch_name + "-" + std::to_string(now_ms()) + "-"
             + std::to_string(m_tx_counter++) + "-" + suffix.to_hex();
    }

    auto coordinator::recover() -> size_t {
        size_t resumed{0};
        for(auto& [key, val] : m_store->scan_side(record_prefix)) {
            auto rec = from_buffer<record>(val);
            if(!rec.has_value()) {
                m_logger->fatal("Unreadable coordinator record", key);
            }
            const auto tx_id = rec->m_tx_id;
            if(rec->m_unresolved) {
                m_logger->warn("Transfer",
                               tx_id,
                               "is unresolved and awaits an operator");
                continue;
            }
            if(rec->m_phase == tx_phase::preparing) {
                m_logger->warn("Transfer",
                               tx_id,
                               "was undecided before restart, aborting");
                rec->m_phase = tx_phase::aborting;
                rec->m_deliver_src = true;
                rec->m_deliver_dst = true;
                rec->m_reason
                    = error{error_code::timeout,
                            "Coordinator restarted before a decision"};
                if(!persist(rec.value())) {
                    m_logger->error("Failed to record abort decision for",
                                    tx_id);
                }
            }
            if(!claim(tx_id)) {
                continue;
            }
            m_logger->info("Resuming delivery for transfer", tx_id);
            m_pool.push([this, r = std::move(rec.value())]() {
                auto id = r.m_tx_id;
                finish(r);
                release(id);
            });
            resumed++;
        }
        return resumed;
    }

    auto coordinator::decided_commits()
        -> std::unordered_set<ledger::tx_id_t> {
        auto ret = std::unordered_set<ledger::tx_id_t>();
        for(auto& [key, val] : m_store->scan_side(record_prefix)) {
            auto rec = from_buffer<record>(val);
            if(!rec.has_value()) {
                m_logger->fatal("Unreadable coordinator record", key);
            }
            if(rec->m_phase == tx_phase::committing && rec->m_deliver_src) {
                ret.insert(rec->m_tx_id);
            }
        }
        return ret;
    }

    auto coordinator::execute(std::optional<ledger::tx_id_t> tx_id,
                              ledger::account_no_t src_account,
                              const network::endpoint_t& dst_endpoint,
                              ledger::account_no_t dst_account,
                              ledger::amount_t amount) -> result {
        auto id = tx_id.has_value() ? std::move(tx_id.value()) : make_tx_id();
        if(amount <= 0) {
            return result{outcome::aborted,
                          id,
                          error{error_code::invalid_argument,
                                "Amount must be positive"}};
        }

        if(network::same_endpoint(dst_endpoint, m_self_endpoint)) {
            m_logger->info("Transfer",
                           id,
                           "stays within the branch, executing locally");
            auto res
                = m_engine->transfer_local(src_account, dst_account, amount);
            if(auto* err = std::get_if<error>(&res)) {
                return result{outcome::aborted, id, std::move(*err)};
            }
            return result{outcome::committed, id, std::nullopt};
        }

        if(!claim(id)) {
            return result{outcome::aborted,
                          id,
                          error{error_code::tx_conflict,
                                "Transfer " + id + " is already in progress"}};
        }
        if(load(id).has_value()) {
            release(id);
            return result{outcome::aborted,
                          id,
                          error{error_code::protocol_violation,
                                "Transfer " + id + " is already known"}};
        }

        auto rec = record{id,
                          src_account,
                          dst_endpoint,
                          dst_account,
                          amount,
                          tx_phase::preparing,
                          false,
                          std::nullopt,
                          now_ms(),
                          true,
                          true};
        auto res = run(std::move(rec));
        release(id);
        return res;
    }

    auto coordinator::list_unresolved() -> std::vector<record> {
        auto ret = std::vector<record>();
        for(auto& [key, val] : m_store->scan_side(record_prefix)) {
            auto rec = from_buffer<record>(val);
            if(!rec.has_value()) {
                m_logger->fatal("Unreadable coordinator record", key);
            }
            if(rec->m_unresolved) {
                ret.emplace_back(std::move(rec.value()));
            }
        }
        return ret;
    }

    auto coordinator::resolve_unresolved(const ledger::tx_id_t& tx_id)
        -> std::variant<result, error> {
        if(!claim(tx_id)) {
            return error{error_code::tx_conflict,
                         "Transfer " + tx_id + " is being resolved already"};
        }
        auto rec = load(tx_id);
        if(!rec.has_value() || !rec->m_unresolved) {
            release(tx_id);
            return error{error_code::not_found,
                         "No unresolved transfer " + tx_id};
        }
        m_logger->info("Retrying delivery for unresolved transfer", tx_id);
        rec->m_unresolved = false;
        auto res = finish(std::move(rec.value()));
        release(tx_id);
        return res;
    }

    auto coordinator::claim(const ledger::tx_id_t& tx_id) -> bool {
        std::unique_lock<std::mutex> l(m_active_mut);
        return m_active.insert(tx_id).second;
    }

    void coordinator::release(const ledger::tx_id_t& tx_id) {
        std::unique_lock<std::mutex> l(m_active_mut);
        m_active.erase(tx_id);
    }

    auto coordinator::run(record rec) -> result {
        if(!persist(rec)) {
            return result{outcome::aborted,
                          rec.m_tx_id,
                          error{error_code::storage_failure,
                                "Failed to record transfer"}};
        }

        m_logger->info("Preparing transfer",
                       rec.m_tx_id,
                       "of",
                       rec.m_amount,
                       "from",
                       rec.m_src_account,
                       "to",
                       rec.m_dst_account,
                       "at",
                       network::to_string(rec.m_dst_endpoint));
        auto remote = m_remote_participants(rec.m_dst_endpoint);
        auto v = prepare(rec, remote);

        rec.m_phase = v.m_commit ? tx_phase::committing : tx_phase::aborting;
        rec.m_deliver_src = v.m_deliver_src;
        rec.m_deliver_dst = v.m_deliver_dst;
        rec.m_reason = v.m_reason;
        if(!persist(rec) && v.m_commit) {
            // A commit decision that is not durable must not be delivered.
            // An undecided record is aborted by recovery, so aborting now
            // is consistent with a restart.
            m_logger->error("Failed to record commit decision for",
                            rec.m_tx_id,
                            ", aborting");
            rec.m_phase = tx_phase::aborting;
            rec.m_deliver_src = true;
            rec.m_deliver_dst = true;
            rec.m_reason = error{error_code::storage_failure,
                                 "Failed to record commit decision"};
        }
        m_logger->info("Decided",
                       rec.m_phase == tx_phase::committing ? "commit"
                                                            : "abort",
                       "for",
                       rec.m_tx_id);
        return finish(std::move(rec));
    }

    auto coordinator::prepare(
        const record& rec,
        const std::shared_ptr<participant::interface>& remote) -> votes {
        struct vote_state {
            std::mutex m_mut;
            std::condition_variable m_cv;
            std::array<std::optional<std::optional<error>>, 2> m_replies;
        };
        auto st = std::make_shared<vote_state>();

        auto ask = [&](size_t idx,
                       std::shared_ptr<participant::interface> target,
                       participant::prepare_params params) {
            m_pool.push([st, idx, target, p = std::move(params)]() {
                auto reply = std::optional<error>();
                if(target) {
                    reply = target->prepare(p);
                } else {
                    reply = error{error_code::peer_unreachable,
                                  "No participant for destination branch"};
                }
                {
                    std::unique_lock<std::mutex> l(st->m_mut);
                    st->m_replies[idx].emplace(std::move(reply));
                }
                st->m_cv.notify_all();
            });
        };
        ask(0,
            m_local,
            participant::prepare_params{rec.m_tx_id,
                                        participant::side::debit,
                                        rec.m_src_account,
                                        rec.m_amount});
        ask(1,
            remote,
            participant::prepare_params{rec.m_tx_id,
                                        participant::side::credit,
                                        rec.m_dst_account,
                                        rec.m_amount});

        static constexpr auto side_names
            = std::array<const char*, 2>{"source", "destination"};
        const auto deadline = std::chrono::steady_clock::now()
                            + m_prepare_timeout;

        std::unique_lock<std::mutex> l(st->m_mut);
        // Wait for both votes, but stop at the first refusal
        st->m_cv.wait_until(l, deadline, [&]() {
            auto all = true;
            for(const auto& reply : st->m_replies) {
                if(!reply.has_value()) {
                    all = false;
                } else if(reply->has_value()) {
                    return true;
                }
            }
            return all;
        });

        auto v = votes();
        v.m_commit = true;
        for(size_t idx{0}; idx < st->m_replies.size(); idx++) {
            const auto& reply = st->m_replies[idx];
            auto& deliver_flag = idx == 0 ? v.m_deliver_src : v.m_deliver_dst;
            if(!reply.has_value()) {
                v.m_commit = false;
                if(!v.m_reason.has_value()) {
                    v.m_reason = error{
                        error_code::timeout,
                        std::string("No prepare vote from ") + side_names[idx]
                            + " within "
                            + std::to_string(m_prepare_timeout.count())
                            + "ms"};
                }
            } else if(reply->has_value()) {
                // A refused prepare left nothing behind to abort. A call
                // that failed in transport may still have prepared.
                v.m_commit = false;
                const auto code = reply->value().m_code;
                deliver_flag = (idx == 0 || remote != nullptr)
                            && (code == error_code::timeout
                                || code == error_code::peer_unreachable);
                if(!v.m_reason.has_value()) {
                    v.m_reason = reply->value();
                }
            }
        }
        if(v.m_reason.has_value()) {
            m_logger->warn("Prepare of",
                           rec.m_tx_id,
                           "failed:",
                           to_string(v.m_reason->m_code),
                           v.m_reason->m_message);
        }
        return v;
    }

    auto coordinator::finish(record rec) -> result {
        const auto commit = rec.m_phase == tx_phase::committing;
        auto remote = m_remote_participants(rec.m_dst_endpoint);

        auto start = [&](bool needed,
                         std::shared_ptr<participant::interface> target) {
            auto p = std::make_shared<std::promise<std::optional<error>>>();
            auto f = p->get_future();
            if(!needed) {
                p->set_value(std::nullopt);
                return f;
            }
            m_pool.push([this, p, target, tx_id = rec.m_tx_id, commit]() {
                p->set_value(deliver(target, tx_id, commit));
            });
            return f;
        };
        auto src_f = start(rec.m_deliver_src, m_local);
        auto dst_f = start(rec.m_deliver_dst, remote);
        auto src_err = src_f.get();
        auto dst_err = dst_f.get();
        if(!commit && dst_err.has_value()
           && dst_err->m_code == error_code::peer_unreachable) {
            // A prepared credit holds no funds and its participant aborts
            // it at the prepare deadline.
            m_logger->warn("Abort of",
                           rec.m_tx_id,
                           "not delivered to destination, left to its",
                           "deadline:",
                           dst_err->m_message);
            dst_err.reset();
        }
        rec.m_deliver_src = src_err.has_value();
        rec.m_deliver_dst = dst_err.has_value();

        if(!src_err.has_value() && !dst_err.has_value()) {
            if(!erase(rec.m_tx_id)) {
                m_logger->warn("Failed to remove record of finished transfer",
                               rec.m_tx_id);
            }
            if(commit) {
                m_logger->info("Committed transfer", rec.m_tx_id);
                return result{outcome::committed, rec.m_tx_id, std::nullopt};
            }
            m_logger->info("Aborted transfer", rec.m_tx_id);
            return result{outcome::aborted, rec.m_tx_id, rec.m_reason};
        }

        auto err = src_err.has_value() ? src_err.value() : dst_err.value();
        {
            std::unique_lock<std::mutex> l(m_stop_mut);
            if(!m_running) {
                // Keep the record as decided so that recovery delivers it
                return result{outcome::unresolved,
                              rec.m_tx_id,
                              error{error_code::unresolved,
                                    "Coordinator stopped during delivery"}};
            }
        }
        rec.m_unresolved = true;
        rec.m_reason = err;
        if(!persist(rec)) {
            m_logger->error("Failed to record unresolved transfer",
                            rec.m_tx_id);
        }
        m_logger->error("Transfer",
                        rec.m_tx_id,
                        "left unresolved,",
                        commit ? "commit" : "abort",
                        "not acknowledged by",
                        src_err.has_value() ? "source" : "destination",
                        ":",
                        err.m_message);
        return result{outcome::unresolved,
                      rec.m_tx_id,
                      error{error_code::unresolved,
                            "Decision not acknowledged: " + err.m_message}};
    }

    auto coordinator::deliver(
        const std::shared_ptr<participant::interface>& target,
        const ledger::tx_id_t& tx_id,
        bool commit) -> std::optional<error> {
        if(!target) {
            return error{error_code::peer_unreachable,
                         "No participant for destination branch"};
        }
        const auto* what = commit ? "commit" : "abort";
        auto delay = m_retry_initial_delay;
        auto last = std::optional<error>(
            error{error_code::unresolved, "No delivery attempts allowed"});
        for(size_t attempt{0}; attempt < m_retry_attempts; attempt++) {
            if(attempt > 0) {
                std::unique_lock<std::mutex> l(m_stop_mut);
                if(m_stop_cv.wait_for(l, delay, [&]() {
                       return !m_running;
                   })) {
                    return error{error_code::unresolved,
                                 "Coordinator stopped"};
                }
                delay = std::min(delay * 2, m_retry_max_delay);
            }
            auto err = commit ? target->commit(tx_id) : target->abort(tx_id);
            if(!err.has_value()) {
                return std::nullopt;
            }
            if(!is_transient(err->m_code)) {
                m_logger->error("Participant refused",
                                what,
                                "of",
                                tx_id,
                                ":",
                                to_string(err->m_code),
                                err->m_message);
                return err;
            }
            m_logger->warn("Delivery of",
                           what,
                           "for",
                           tx_id,
                           "failed on attempt",
                           attempt + 1,
                           "of",
                           m_retry_attempts,
                           ":",
                           err->m_message);
            last = std::move(err);
        }
        return last;
    }

    auto coordinator::persist(const record& rec) -> bool {
        return m_store->put_side(
            ledger::side_write{record_key(rec.m_tx_id), make_buffer(rec)});
    }

    auto coordinator::erase(const ledger::tx_id_t& tx_id) -> bool {
        return m_store->put_side(
            ledger::side_write{record_key(tx_id), std::nullopt});
    }

    auto coordinator::load(const ledger::tx_id_t& tx_id)
        -> std::optional<record> {
        auto val = m_store->get_side(record_key(tx_id));
        if(!val.has_value()) {
            return std::nullopt;
        }
        auto rec = from_buffer<record>(val.value());
        if(!rec.has_value()) {
            m_logger->fatal("Unreadable coordinator record", tx_id);
        }
        return rec;
    }

    auto coordinator::record_key(const ledger::tx_id_t& tx_id)
        -> std::string {
        return record_prefix + tx_id;
    }
}
