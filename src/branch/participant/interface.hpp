// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_PARTICIPANT_INTERFACE_H_
#define BRANCHNET_SRC_BRANCH_PARTICIPANT_INTERFACE_H_

#include "branch/error.hpp"
#include "messages.hpp"

#include <optional>

namespace branchnet::participant {
    /// Interface for the branch-local half of the two-phase commit
    /// protocol. Implementations must make commit and abort idempotent.
    /// \see participant for the implementation backed by a ledger store
    /// \see client for an implementation that forwards calls to a remote
    ///      branch
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Moves a transfer from IDLE to PREPARED. Repeating a prepare
        /// with identical parameters succeeds again.
        /// \param params transfer side to prepare.
        /// \return std::nullopt if the transfer is PREPARED, otherwise the
        ///         reason it could not be prepared.
        virtual auto prepare(const prepare_params& params)
            -> std::optional<error> = 0;

        /// Moves a PREPARED transfer to COMMITTED. Succeeds without change
        /// if the transfer is already COMMITTED.
        /// \param tx_id transfer to commit.
        /// \return std::nullopt on success, otherwise the error.
        virtual auto commit(const ledger::tx_id_t& tx_id)
            -> std::optional<error> = 0;

        /// Moves a transfer to ABORTED. Succeeds without change if the
        /// transfer is already ABORTED or was never prepared.
        /// \param tx_id transfer to abort.
        /// \return std::nullopt on success, otherwise the error.
        virtual auto abort(const ledger::tx_id_t& tx_id)
            -> std::optional<error> = 0;
    };
}

#endif // BRANCHNET_SRC_BRANCH_PARTICIPANT_INTERFACE_H_
