// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_COORDINATOR_COORDINATOR_H_
#define BRANCHNET_SRC_BRANCH_COORDINATOR_COORDINATOR_H_

#include "branch/engine/engine.hpp"
#include "branch/ledger/store.hpp"
#include "branch/participant/interface.hpp"
#include "messages.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"
#include "util/common/thread_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_set>

namespace branchnet::coordinator {
    /// Returns the participant of the branch listening on the given
    /// endpoint.
    using participant_factory
        = std::function<std::shared_ptr<participant::interface>(
            const network::endpoint_t&)>;

    /// \brief Drives inter-branch transfers through two-phase commit.
    ///
    /// Runs at the branch holding the source account. Prepares the debit at
    /// the local participant and the credit at the destination branch's
    /// participant concurrently under one shared timeout, commits only if
    /// both prepared, and delivers the decision to both sides with
    /// independent retry schedules. Never touches a ledger itself.
    ///
    /// Progress of each transfer is written to the branch's ledger store
    /// before every protocol step, so that a restarted coordinator can
    /// finish what it started: transfers found undecided are aborted,
    /// decided ones are delivered again. Decisions that could not be
    /// delivered are kept as unresolved records for an operator.
    class coordinator {
      public:
        /// Constructor.
        /// \param branch_name name of this branch, prefix of generated
        ///                    transfer IDs.
        /// \param self_endpoint endpoint of this branch. Transfers to it are
        ///                      executed as local transfers.
        /// \param store ledger store of this branch, holding coordinator
        ///              records.
        /// \param eng transaction engine of this branch.
        /// \param local participant of this branch.
        /// \param remote_participants source of remote participants.
        /// \param opts configuration options.
        /// \param logger log instance.
        coordinator(std::string branch_name,
                    network::endpoint_t self_endpoint,
                    std::shared_ptr<ledger::store> store,
                    std::shared_ptr<engine::engine> eng,
                    std::shared_ptr<participant::interface> local,
                    participant_factory remote_participants,
                    const config::options& opts,
                    std::shared_ptr<logging::log> logger);

        coordinator() = delete;
        coordinator(const coordinator&) = delete;
        auto operator=(const coordinator&) -> coordinator& = delete;
        coordinator(coordinator&&) = delete;
        auto operator=(coordinator&&) -> coordinator& = delete;

        /// Stops retries and waits for background deliveries.
        ~coordinator();

        /// Resumes transfers found in the store. Undecided transfers are
        /// decided abort. Decided transfers are delivered again in the
        /// background. Unresolved transfers stay listed.
        /// \return number of transfers resumed.
        auto recover() -> size_t;

        /// Lists transfers decided commit whose local debit has not been
        /// acknowledged yet, unresolved ones included. The local
        /// participant must keep these PREPARED across a restart.
        /// \return IDs of the transfers.
        auto decided_commits() -> std::unordered_set<ledger::tx_id_t>;

        /// Executes an inter-branch transfer.
        /// \param tx_id transfer ID to use, generated if std::nullopt.
        /// \param src_account account of this branch to debit.
        /// \param dst_endpoint branch holding the destination account.
        /// \param dst_account account to credit.
        /// \param amount amount to move.
        /// \return committed, aborted with the reason, or unresolved.
        auto execute(std::optional<ledger::tx_id_t> tx_id,
                     ledger::account_no_t src_account,
                     const network::endpoint_t& dst_endpoint,
                     ledger::account_no_t dst_account,
                     ledger::amount_t amount) -> result;

        /// Lists transfers whose decision could not be delivered.
        /// \return unresolved records.
        auto list_unresolved() -> std::vector<record>;

        /// Retries delivery of the decision of an unresolved transfer.
        /// \param tx_id transfer to resolve.
        /// \return new outcome, not_found if no such unresolved transfer
        ///         exists, or tx_conflict if it is being resolved already.
        auto resolve_unresolved(const ledger::tx_id_t& tx_id)
            -> std::variant<result, error>;

        /// Stops retry loops. Transfers interrupted by this are finished
        /// by recover() after the next start.
        void stop();

        /// Generates a new transfer ID of the form
        /// <branch>-<milliseconds>-<counter>-<random hex>.
        /// \return transfer ID.
        auto make_tx_id() -> ledger::tx_id_t;

      private:
        std::string m_branch_name;
        network::endpoint_t m_self_endpoint;
        std::shared_ptr<ledger::store> m_store;
        std::shared_ptr<engine::engine> m_engine;
        std::shared_ptr<participant::interface> m_local;
        participant_factory m_remote_participants;
        std::shared_ptr<logging::log> m_logger;

        std::chrono::milliseconds m_prepare_timeout;
        size_t m_retry_attempts;
        std::chrono::milliseconds m_retry_initial_delay;
        std::chrono::milliseconds m_retry_max_delay;

        std::mutex m_active_mut;
        std::unordered_set<ledger::tx_id_t> m_active;

        std::mutex m_stop_mut;
        std::condition_variable m_stop_cv;
        bool m_running{true};

        std::mutex m_rng_mut;
        std::default_random_engine m_rng;
        std::atomic<uint64_t> m_tx_counter{0};

        auto claim(const ledger::tx_id_t& tx_id) -> bool;
        void release(const ledger::tx_id_t& tx_id);

        /// Outcome of the prepare phase.
        struct votes {
            bool m_commit{false};
            bool m_deliver_src{true};
            bool m_deliver_dst{true};
            std::optional<error> m_reason;
        };

        auto run(record rec) -> result;

        auto prepare(const record& rec,
                     const std::shared_ptr<participant::interface>& remote)
            -> votes;

        auto finish(record rec) -> result;

        auto deliver(const std::shared_ptr<participant::interface>& target,
                     const ledger::tx_id_t& tx_id,
                     bool commit) -> std::optional<error>;

        auto persist(const record& rec) -> bool;
        auto erase(const ledger::tx_id_t& tx_id) -> bool;
        auto load(const ledger::tx_id_t& tx_id) -> std::optional<record>;

        static auto record_key(const ledger::tx_id_t& tx_id) -> std::string;

        // Declared last so that background tasks finish before the members
        // they use are destroyed.
        thread_pool m_pool;
    };
}

#endif // BRANCHNET_SRC_BRANCH_COORDINATOR_COORDINATOR_H_
