// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_CLIENT_CLIENT_H_
#define BRANCHNET_SRC_BRANCH_CLIENT_CLIENT_H_

#include "branch/format.hpp"
#include "branch/messages.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/tcp_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace branchnet::branch {
    /// Typed RPC client for one branch. Used by the operator client and by
    /// coordinators to reach remote participants. Thread safe. The
    /// connection is opened on first use and re-opened after it was found
    /// to be down.
    class client {
      public:
        /// Constructor.
        /// \param endpoint branch to connect to.
        /// \param default_timeout time bound of calls made without an
        ///                        explicit timeout. Zero waits forever.
        /// \param logger log instance.
        client(network::endpoint_t endpoint,
               std::chrono::milliseconds default_timeout,
               std::shared_ptr<logging::log> logger);

        client() = delete;
        client(const client&) = delete;
        auto operator=(const client&) -> client& = delete;
        client(client&&) = delete;
        auto operator=(client&&) -> client& = delete;

        ~client() = default;

        /// Connects to the branch.
        /// \return false if the branch could not be reached.
        auto init() -> bool;

        /// Account read and update results.
        using account_result = std::variant<ledger::account, error>;

        /// Reads an account.
        /// \param account_no account to read.
        /// \return account or error.
        auto balance(ledger::account_no_t account_no) -> account_result;

        /// Credits an account.
        /// \param account_no account to credit.
        /// \param amount amount to credit.
        /// \return updated account or error.
        auto deposit(ledger::account_no_t account_no, ledger::amount_t amount)
            -> account_result;

        /// Debits an account.
        /// \param account_no account to debit.
        /// \param amount amount to debit.
        /// \return updated account or error.
        auto withdraw(ledger::account_no_t account_no, ledger::amount_t amount)
            -> account_result;

        /// Moves funds between two accounts of the branch.
        /// \param src_account account to debit.
        /// \param dst_account account to credit.
        /// \param amount amount to move.
        /// \return updated source and destination accounts, or error.
        auto transfer_local(ledger::account_no_t src_account,
                            ledger::account_no_t dst_account,
                            ledger::amount_t amount)
            -> std::variant<transfer_local_response, error>;

        /// Asks the branch to coordinate a transfer to another branch.
        /// \param req transfer parameters.
        /// \return outcome of the transfer, or an error if the branch could
        ///         not be asked.
        auto inter_branch_transfer(inter_branch_transfer_request req)
            -> std::variant<coordinator::result, error>;

        /// Lists every account of the branch.
        /// \return accounts or error.
        auto list_accounts()
            -> std::variant<std::vector<ledger::account>, error>;

        /// Opens an account.
        /// \param account_no number of the account.
        /// \param name holder name.
        /// \param balance initial balance.
        /// \return new account or error.
        auto create_account(ledger::account_no_t account_no,
                            std::string name,
                            ledger::amount_t balance) -> account_result;

        /// Lists transfers the branch left unresolved.
        /// \return coordinator records or error.
        auto list_unresolved()
            -> std::variant<std::vector<coordinator::record>, error>;

        /// Retries delivery of an unresolved transfer's decision.
        /// \param tx_id transfer to resolve.
        /// \return new outcome or error.
        auto resolve_unresolved(const ledger::tx_id_t& tx_id)
            -> std::variant<coordinator::result, error>;

        /// Sends a prepare request.
        /// \param params transfer side to prepare.
        /// \param timeout time bound of the call.
        /// \return std::nullopt if the branch prepared, otherwise the error.
        auto prepare(const participant::prepare_params& params,
                     std::chrono::milliseconds timeout)
            -> std::optional<error>;

        /// Sends a commit request.
        /// \param tx_id transfer to commit.
        /// \param timeout time bound of the call.
        /// \return std::nullopt if the branch committed, otherwise the
        ///         error.
        auto commit(const ledger::tx_id_t& tx_id,
                    std::chrono::milliseconds timeout)
            -> std::optional<error>;

        /// Sends an abort request.
        /// \param tx_id transfer to abort.
        /// \param timeout time bound of the call.
        /// \return std::nullopt if the branch aborted, otherwise the error.
        auto abort(const ledger::tx_id_t& tx_id,
                   std::chrono::milliseconds timeout)
            -> std::optional<error>;

        /// Returns the endpoint of the branch.
        [[nodiscard]] auto endpoint() const -> const network::endpoint_t&;

      private:
        using rpc_client = rpc::tcp_client<request, response>;

        network::endpoint_t m_endpoint;
        std::chrono::milliseconds m_default_timeout;
        std::shared_ptr<logging::log> m_logger;

        std::mutex m_client_mut;
        std::shared_ptr<rpc_client> m_client;

        auto connect() -> std::shared_ptr<rpc_client>;

        auto send(request req, std::chrono::milliseconds timeout) -> response;

        template<typename T>
        auto send_expecting(request req, std::chrono::milliseconds timeout)
            -> std::variant<T, error> {
            auto resp = send(std::move(req), timeout);
            if(auto* err = std::get_if<error>(&resp)) {
                return std::move(*err);
            }
            if(auto* val = std::get_if<T>(&resp)) {
                return std::move(*val);
            }
            return error{error_code::protocol_violation,
                         "Unexpected response type from "
                             + network::to_string(m_endpoint)};
        }
    };
}

#endif // BRANCHNET_SRC_BRANCH_CLIENT_CLIENT_H_
