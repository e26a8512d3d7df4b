// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_COORDINATOR_MESSAGES_H_
#define BRANCHNET_SRC_BRANCH_COORDINATOR_MESSAGES_H_

#include "branch/error.hpp"
#include "branch/ledger/messages.hpp"
#include "util/network/socket.hpp"

#include <optional>

namespace branchnet::coordinator {
    /// Final or non-final outcome of an inter-branch transfer.
    enum class outcome : uint8_t {
        /// Both participants committed.
        committed,
        /// Both participants aborted, or neither ever held anything.
        aborted,
        /// The decision could not be delivered to both participants. Needs
        /// operator reconciliation.
        unresolved
    };

    /// Result of an inter-branch transfer returned to the caller.
    struct result {
        /// Outcome of the transfer.
        outcome m_outcome{};
        /// Transfer ID.
        ledger::tx_id_t m_tx_id;
        /// Why the transfer was aborted or left unresolved.
        std::optional<error> m_reason;
    };

    /// Progress of a transfer at its coordinator.
    enum class tx_phase : uint8_t {
        /// Prepares sent, no decision yet.
        preparing,
        /// Decided commit, delivering.
        committing,
        /// Decided abort, delivering.
        aborting
    };

    /// Durable coordinator record of one transfer, kept until both
    /// participants acknowledged the decision.
    struct record {
        /// Transfer ID.
        ledger::tx_id_t m_tx_id;
        /// Account debited at this branch.
        ledger::account_no_t m_src_account{};
        /// Branch holding the destination account.
        network::endpoint_t m_dst_endpoint;
        /// Account credited at the destination branch.
        ledger::account_no_t m_dst_account{};
        /// Amount of the transfer.
        ledger::amount_t m_amount{};
        /// Current phase.
        tx_phase m_phase{};
        /// True once delivery of the decision was given up.
        bool m_unresolved{false};
        /// Reason for an abort decision, or the delivery failure that left
        /// the transfer unresolved.
        std::optional<error> m_reason;
        /// Milliseconds since the epoch at which the transfer started.
        uint64_t m_created{};
        /// True while the source side has not acknowledged the decision.
        bool m_deliver_src{true};
        /// True while the destination side has not acknowledged the
        /// decision.
        bool m_deliver_dst{true};
    };
}

#endif // BRANCHNET_SRC_BRANCH_COORDINATOR_MESSAGES_H_
