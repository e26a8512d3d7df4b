// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_LEDGER_MESSAGES_H_
#define BRANCHNET_SRC_BRANCH_LEDGER_MESSAGES_H_

#include "util/common/buffer.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace branchnet::ledger {
    /// Account number, unique within a branch.
    using account_no_t = uint64_t;
    /// Amount of money in minor units.
    using amount_t = int64_t;
    /// Globally unique identifier of an inter-branch transfer.
    using tx_id_t = std::string;

    /// Kind of operation recorded in the operation log.
    enum class op_kind : uint8_t {
        deposit,
        withdraw,
        transfer_local,
        transfer_prepare,
        transfer_commit,
        transfer_abort
    };

    /// Account record held by the ledger store.
    struct account {
        /// Account number.
        account_no_t m_account_no{};
        /// Holder name.
        std::string m_name;
        /// Balance in minor units. Never negative.
        amount_t m_balance{};
        /// Funds held for a pending inter-branch transfer. Never exceeds
        /// the balance.
        amount_t m_reserved{};
        /// Incremented on every change to the record.
        uint64_t m_version{};
        /// Transfer holding the reservation, if any.
        std::optional<tx_id_t> m_reserved_by;

        auto operator==(const account& rhs) const -> bool;
    };

    /// Immutable operation log entry.
    struct log_entry {
        /// Position in the log, strictly increasing.
        uint64_t m_seq{};
        /// Milliseconds since the epoch at which the entry was written.
        uint64_t m_timestamp{};
        /// Operation kind.
        op_kind m_kind{};
        /// Account affected by the operation.
        account_no_t m_account_no{};
        /// Amount moved or reserved.
        amount_t m_amount{};
        /// Transfer the operation belongs to, if any.
        std::optional<tx_id_t> m_tx_id;

        auto operator==(const log_entry& rhs) const -> bool;
    };

    /// Extra record written atomically with a ledger mutation. Used by
    /// components that keep their own durable state next to the accounts.
    struct side_write {
        /// Record key.
        std::string m_key;
        /// New record value, or std::nullopt to delete the record.
        std::optional<buffer> m_value;
    };
}

#endif // BRANCHNET_SRC_BRANCH_LEDGER_MESSAGES_H_
