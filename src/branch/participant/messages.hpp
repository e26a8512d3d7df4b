// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_PARTICIPANT_MESSAGES_H_
#define BRANCHNET_SRC_BRANCH_PARTICIPANT_MESSAGES_H_

#include "branch/ledger/messages.hpp"

#include <cstdint>

namespace branchnet::participant {
    /// Side of an inter-branch transfer a participant is asked to prepare.
    enum class side : uint8_t {
        /// Funds leave the account. Prepare reserves them.
        debit,
        /// Funds arrive on the account. Prepare only records the intent.
        credit
    };

    /// States of a transfer at one participant. COMMITTED and ABORTED are
    /// terminal.
    enum class tx_state : uint8_t {
        idle,
        prepared,
        committed,
        aborted
    };

    /// Parameters of a prepare request.
    struct prepare_params {
        /// Transfer ID.
        ledger::tx_id_t m_tx_id;
        /// Side of the transfer handled by the participant.
        side m_side{};
        /// Account to debit or credit.
        ledger::account_no_t m_account_no{};
        /// Amount of the transfer.
        ledger::amount_t m_amount{};

        auto operator==(const prepare_params& rhs) const -> bool;
    };

    /// Durable state of one transfer at a participant.
    struct record {
        /// Side of the transfer.
        side m_side{};
        /// Account debited or credited.
        ledger::account_no_t m_account_no{};
        /// Amount of the transfer.
        ledger::amount_t m_amount{};
        /// Current state. Never idle once persisted.
        tx_state m_state{};
        /// Milliseconds since the epoch after which a PREPARED transfer is
        /// aborted unilaterally.
        uint64_t m_deadline{};
        /// Milliseconds since the epoch at which the transfer reached a
        /// terminal state, zero while PREPARED.
        uint64_t m_resolved_at{};
    };
}

#endif // BRANCHNET_SRC_BRANCH_PARTICIPANT_MESSAGES_H_
