// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_PARTICIPANT_PARTICIPANT_H_
#define BRANCHNET_SRC_BRANCH_PARTICIPANT_PARTICIPANT_H_

#include "branch/ledger/store.hpp"
#include "interface.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace branchnet::participant {
    /// \brief Participant state machine backed by the branch's ledger
    /// store.
    ///
    /// Each transfer moves IDLE -> PREPARED -> COMMITTED or ABORTED. The
    /// record of a transfer is written in the same atomic batch as the
    /// ledger change of each transition, so a restart always finds the
    /// record and the reservation in agreement. Calls for one transfer are
    /// serialized. Calls for different transfers run in parallel, limited
    /// only by the per-account locking of the store.
    ///
    /// PREPARED records carry a deadline. A background sweeper aborts
    /// records whose deadline has passed and forgets terminal records once
    /// their retention time is over.
    class participant final : public interface {
      public:
        /// Constructor. Call init() before using.
        /// \param store ledger store of the branch.
        /// \param opts configuration options.
        /// \param logger log instance.
        participant(std::shared_ptr<ledger::store> store,
                    const config::options& opts,
                    std::shared_ptr<logging::log> logger);

        participant() = delete;
        participant(const participant&) = delete;
        auto operator=(const participant&) -> participant& = delete;
        participant(participant&&) = delete;
        auto operator=(participant&&) -> participant& = delete;

        /// Stops the deadline sweeper.
        ~participant() override;

        /// Loads persisted records, applies the configured recovery policy
        /// to PREPARED records and starts the deadline sweeper.
        /// \param committing transfers the co-located coordinator already
        ///                   decided to commit. They stay PREPARED under
        ///                   either policy.
        /// \return false if a recovery abort could not be written.
        auto init(const std::unordered_set<ledger::tx_id_t>& committing
                  = {}) -> bool;

        /// Stops the deadline sweeper. Safe to call more than once.
        void stop();

        /// Prepares one side of a transfer. A debit reserves the funds, a
        /// credit checks that the account exists.
        /// \param params transfer side to prepare.
        /// \return std::nullopt if PREPARED. invalid_argument for a
        ///         non-positive amount, protocol_violation if the transfer
        ///         is already known with other parameters or already
        ///         resolved, otherwise the ledger error.
        auto prepare(const prepare_params& params)
            -> std::optional<error> override;

        /// Commits a PREPARED transfer. A debit converts the reservation
        /// into a balance decrease, a credit increases the balance.
        /// \param tx_id transfer to commit.
        /// \return std::nullopt if COMMITTED. protocol_violation if the
        ///         transfer is unknown or ABORTED.
        auto commit(const ledger::tx_id_t& tx_id)
            -> std::optional<error> override;

        /// Aborts a transfer. A PREPARED debit releases its reservation.
        /// An unknown transfer leaves an ABORTED record behind so that a
        /// prepare arriving later is refused.
        /// \param tx_id transfer to abort.
        /// \return std::nullopt if ABORTED. protocol_violation if the
        ///         transfer is COMMITTED.
        auto abort(const ledger::tx_id_t& tx_id)
            -> std::optional<error> override;

        /// Returns the current state of a transfer.
        /// \param tx_id transfer to look up.
        /// \return state of the transfer, idle if unknown.
        auto state(const ledger::tx_id_t& tx_id) -> tx_state;

        /// Aborts PREPARED transfers whose deadline has passed and forgets
        /// terminal transfers past their retention time. Called
        /// periodically by the sweeper.
        /// \return number of transfers aborted.
        auto sweep() -> size_t;

      private:
        struct entry {
            std::mutex m_mut;
            std::optional<record> m_record;
            bool m_removed{false};
            // Commit decided by the co-located coordinator. Exempt from
            // the deadline sweep.
            bool m_commit_pending{false};
        };

        std::shared_ptr<ledger::store> m_store;
        std::shared_ptr<logging::log> m_logger;

        std::chrono::milliseconds m_deadline;
        std::chrono::milliseconds m_sweep_interval;
        config::recovery_policy m_recovery;
        std::chrono::milliseconds m_retention;

        std::mutex m_entries_mut;
        std::unordered_map<ledger::tx_id_t, std::shared_ptr<entry>>
            m_entries;

        std::mutex m_sweep_mut;
        std::condition_variable m_sweep_cv;
        bool m_running{false};
        std::thread m_sweep_thread;

        auto acquire(const ledger::tx_id_t& tx_id)
            -> std::pair<std::shared_ptr<entry>, std::unique_lock<std::mutex>>;

        void remove(const ledger::tx_id_t& tx_id,
                    const std::shared_ptr<entry>& e);

        auto abort_prepared(const ledger::tx_id_t& tx_id, entry& e)
            -> std::optional<error>;

        static auto record_key(const ledger::tx_id_t& tx_id) -> std::string;

        static auto write_of(const ledger::tx_id_t& tx_id, const record& r)
            -> ledger::side_write;

        void sweep_loop();
    };

    /// Returns the current time in milliseconds since the epoch, the clock
    /// used for persisted deadlines.
    auto now_ms() -> uint64_t;
}

#endif // BRANCHNET_SRC_BRANCH_PARTICIPANT_PARTICIPANT_H_
