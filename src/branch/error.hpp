// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_ERROR_H_
#define BRANCHNET_SRC_BRANCH_ERROR_H_

#include <cstdint>
#include <string>

namespace branchnet {
    /// Kinds of failure reported by branch operations.
    enum class error_code : uint8_t {
        /// Unknown account number.
        not_found,
        /// Available balance is lower than the requested amount.
        insufficient_funds,
        /// The account already carries a reservation for another
        /// transaction.
        tx_conflict,
        /// A peer did not answer within the time bound.
        timeout,
        /// A connection to a peer could not be established.
        peer_unreachable,
        /// Malformed request, or a prepare, commit or abort arriving out of
        /// order.
        protocol_violation,
        /// Transaction left undecided after retries were exhausted.
        unresolved,
        /// Non-positive amount, identical source and destination or a
        /// malformed field.
        invalid_argument,
        /// An account with the given number already exists.
        account_exists,
        /// The ledger store refused a write. Nothing was changed.
        /// Keep last, decoding rejects codes past it.
        storage_failure
    };

    /// Error returned by a branch operation.
    struct error {
        /// Failure kind.
        error_code m_code{};
        /// Human readable detail.
        std::string m_message;

        auto operator==(const error& rhs) const -> bool;
    };

    /// Returns the upper-case name of an error code, as printed by the
    /// operator client and in logs.
    /// \param code error code.
    /// \return name of the code.
    auto to_string(error_code code) -> std::string;
}

#endif // BRANCHNET_SRC_BRANCH_ERROR_H_
