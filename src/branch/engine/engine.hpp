// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_ENGINE_ENGINE_H_
#define BRANCHNET_SRC_BRANCH_ENGINE_ENGINE_H_

#include "branch/ledger/store.hpp"
#include "util/common/logging.hpp"

#include <array>
#include <memory>
#include <string>

namespace branchnet::engine {
    /// Accounts created by preload() on an empty ledger.
    static constexpr auto preload_accounts
        = std::array<ledger::account_no_t, 2>{1001, 1002};
    /// Balance of each preloaded account.
    static constexpr ledger::amount_t preload_balance{1000};

    /// Executes single-branch operations as one atomic step against the
    /// ledger store. Each successful operation has exactly one entry in the
    /// operation log. Errors are returned to the caller and never retried.
    class engine {
      public:
        /// Constructor.
        /// \param branch_name name of the branch, used to name preloaded
        ///                    accounts.
        /// \param store ledger store of the branch.
        /// \param logger log instance.
        engine(std::string branch_name,
               std::shared_ptr<ledger::store> store,
               std::shared_ptr<logging::log> logger);

        /// Returns the current state of an account.
        /// \param account_no account to read.
        /// \return account or not_found.
        auto balance(ledger::account_no_t account_no)
            -> ledger::store::account_result;

        /// Credits an account.
        /// \param account_no account to credit.
        /// \param amount positive amount.
        /// \return updated account or error.
        auto deposit(ledger::account_no_t account_no, ledger::amount_t amount)
            -> ledger::store::account_result;

        /// Debits an account. Rejected with insufficient_funds, leaving the
        /// balance unchanged, if the available balance is too low.
        /// \param account_no account to debit.
        /// \param amount positive amount.
        /// \return updated account or error.
        auto withdraw(ledger::account_no_t account_no, ledger::amount_t amount)
            -> ledger::store::account_result;

        /// Moves funds between two accounts of this branch.
        /// \param src_account account to debit.
        /// \param dst_account account to credit.
        /// \param amount positive amount.
        /// \return updated source and destination accounts or error.
        auto transfer_local(ledger::account_no_t src_account,
                            ledger::account_no_t dst_account,
                            ledger::amount_t amount)
            -> ledger::store::pair_result;

        /// Returns every account of the branch.
        /// \return accounts ordered by number.
        auto list_accounts() -> std::vector<ledger::account>;

        /// Opens a new account.
        /// \param account_no number of the account.
        /// \param name holder name.
        /// \param balance initial balance.
        /// \return new account or error.
        auto create_account(ledger::account_no_t account_no,
                            std::string name,
                            ledger::amount_t balance)
            -> ledger::store::account_result;

        /// Creates the sample accounts if the ledger holds no account yet.
        /// \return false if creating an account failed.
        auto preload() -> bool;

      private:
        std::string m_branch_name;
        std::shared_ptr<ledger::store> m_store;
        std::shared_ptr<logging::log> m_logger;

        void log_result(const std::string& op,
                        const ledger::store::account_result& res);
    };
}

#endif // BRANCHNET_SRC_BRANCH_ENGINE_ENGINE_H_
