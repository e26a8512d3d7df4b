// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file messages.hpp
 * Requests and responses exchanged with a branch, by clients and by peer
 * branches alike.
 */

#ifndef BRANCHNET_SRC_BRANCH_MESSAGES_H_
#define BRANCHNET_SRC_BRANCH_MESSAGES_H_

#include "branch/coordinator/messages.hpp"
#include "branch/error.hpp"
#include "branch/ledger/messages.hpp"
#include "branch/participant/messages.hpp"
#include "util/network/socket.hpp"

#include <variant>
#include <vector>

namespace branchnet::branch {
    /// Reads an account.
    struct balance_request {
        ledger::account_no_t m_account_no{};
    };

    /// Credits an account.
    struct deposit_request {
        ledger::account_no_t m_account_no{};
        ledger::amount_t m_amount{};
    };

    /// Debits an account.
    struct withdraw_request {
        ledger::account_no_t m_account_no{};
        ledger::amount_t m_amount{};
    };

    /// Moves funds between two accounts of the same branch.
    struct transfer_local_request {
        ledger::account_no_t m_src_account{};
        ledger::account_no_t m_dst_account{};
        ledger::amount_t m_amount{};
    };

    /// Peer request preparing one side of an inter-branch transfer.
    struct prepare_request {
        participant::prepare_params m_params;
    };

    /// Peer request committing a prepared transfer.
    struct commit_request {
        ledger::tx_id_t m_tx_id;
    };

    /// Peer request aborting a transfer.
    struct abort_request {
        ledger::tx_id_t m_tx_id;
    };

    /// Moves funds from an account of the receiving branch to an account
    /// of another branch. The receiving branch coordinates the transfer.
    struct inter_branch_transfer_request {
        /// Transfer ID, generated by the coordinator if absent.
        std::optional<ledger::tx_id_t> m_tx_id;
        ledger::account_no_t m_src_account{};
        /// Branch holding the destination account.
        network::endpoint_t m_dst_endpoint;
        ledger::account_no_t m_dst_account{};
        ledger::amount_t m_amount{};
    };

    /// Lists every account of the branch.
    struct list_accounts_request {};

    /// Opens an account.
    struct create_account_request {
        ledger::account_no_t m_account_no{};
        std::string m_name;
        ledger::amount_t m_balance{};
    };

    /// Lists transfers coordinated by the branch that were left
    /// unresolved.
    struct list_unresolved_request {};

    /// Retries delivery of the decision of an unresolved transfer.
    struct resolve_unresolved_request {
        ledger::tx_id_t m_tx_id;
    };

    /// Request to a branch. The alternative selects the operation.
    using request = std::variant<balance_request,
                                 deposit_request,
                                 withdraw_request,
                                 transfer_local_request,
                                 prepare_request,
                                 commit_request,
                                 abort_request,
                                 inter_branch_transfer_request,
                                 list_accounts_request,
                                 create_account_request,
                                 list_unresolved_request,
                                 resolve_unresolved_request>;

    struct balance_response {
        ledger::account m_account;
    };

    struct deposit_response {
        ledger::account m_account;
    };

    struct withdraw_response {
        ledger::account m_account;
    };

    struct transfer_local_response {
        ledger::account m_src_account;
        ledger::account m_dst_account;
    };

    struct prepare_response {
        bool m_prepared{false};
    };

    struct commit_response {
        bool m_committed{false};
    };

    struct abort_response {
        bool m_aborted{false};
    };

    struct inter_branch_transfer_response {
        coordinator::result m_result;
    };

    struct list_accounts_response {
        std::vector<ledger::account> m_accounts;
    };

    struct create_account_response {
        ledger::account m_account;
    };

    struct list_unresolved_response {
        std::vector<coordinator::record> m_records;
    };

    struct resolve_unresolved_response {
        coordinator::result m_result;
    };

    /// Response from a branch: the result of the requested operation, or
    /// the error that prevented it.
    using response = std::variant<balance_response,
                                  deposit_response,
                                  withdraw_response,
                                  transfer_local_response,
                                  prepare_response,
                                  commit_response,
                                  abort_response,
                                  inter_branch_transfer_response,
                                  list_accounts_response,
                                  create_account_response,
                                  list_unresolved_response,
                                  resolve_unresolved_response,
                                  error>;
}

#endif // BRANCHNET_SRC_BRANCH_MESSAGES_H_
