// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file store.hpp
 * Durable per-branch account table and operation log.
 */

#ifndef BRANCHNET_SRC_BRANCH_LEDGER_STORE_H_
#define BRANCHNET_SRC_BRANCH_LEDGER_STORE_H_

#include "branch/error.hpp"
#include "messages.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace branchnet::ledger {
    /// \brief Account table and operation log of one branch, kept in a
    /// single LevelDB database.
    ///
    /// Every mutation writes the changed account records, exactly one
    /// operation log entry and any caller-supplied side records in one
    /// atomic write batch, so the log never misses a mutation and a
    /// mutation never exists without its log entry. Mutations on one
    /// account are serialized by a per-account mutex held only for the
    /// duration of the call. Mutations on different accounts proceed in
    /// parallel.
    ///
    /// An account carries at most one reservation, owned by a single
    /// transfer ID, between the prepare and the resolution of that
    /// transfer.
    class store {
      public:
        /// Constructor. Call open_db() before using.
        /// \param logger log instance.
        explicit store(std::shared_ptr<logging::log> logger);

        store() = delete;
        store(const store&) = delete;
        auto operator=(const store&) -> store& = delete;
        store(store&&) = delete;
        auto operator=(store&&) -> store& = delete;

        ~store() = default;

        /// Creates or reopens the database in the given directory.
        /// \param db_dir path to the database directory.
        /// \return std::nullopt on success, otherwise the error message.
        auto open_db(const std::string& db_dir) -> std::optional<std::string>;

        /// Result of an operation returning one account.
        using account_result = std::variant<account, error>;
        /// Result of an operation changing two accounts, in argument order.
        using pair_result = std::variant<std::pair<account, account>, error>;

        /// Returns the current state of an account.
        /// \param account_no account to read.
        /// \return account, or not_found.
        auto get(account_no_t account_no) -> account_result;

        /// Returns every account, ordered by account number.
        /// \return list of accounts.
        auto list_accounts() -> std::vector<account>;

        /// Returns whether the store holds no accounts.
        /// \return true if empty.
        auto empty() -> bool;

        /// Creates an account. Does not write an operation log entry since
        /// no money moves.
        /// \param account_no number of the new account.
        /// \param name holder name.
        /// \param balance initial balance, must not be negative.
        /// \return new account, account_exists or invalid_argument.
        auto create_account(account_no_t account_no,
                            std::string name,
                            amount_t balance) -> account_result;

        /// Reserves funds on an account for a transfer. Fails without
        /// waiting if the available balance is too low or the account is
        /// already reserved by another transfer. Reserving again for the
        /// same transfer and amount succeeds without another change.
        /// Logs TransferPrepare.
        /// \param account_no account to reserve on.
        /// \param amount amount to reserve, must be positive.
        /// \param tx_id transfer owning the reservation.
        /// \param side optional record to write atomically.
        /// \return updated account, or not_found, insufficient_funds,
        ///         tx_conflict, invalid_argument or storage_failure.
        auto reserve(account_no_t account_no,
                     amount_t amount,
                     const tx_id_t& tx_id,
                     std::optional<side_write> side = std::nullopt)
            -> account_result;

        /// Returns reserved funds to the available balance. Logs
        /// TransferAbort. An account with no reservation for the transfer
        /// is left unchanged but the abort is still logged.
        /// \param account_no account to release.
        /// \param tx_id transfer owning the reservation.
        /// \param side optional record to write atomically.
        /// \return updated account, or not_found or storage_failure.
        auto release(account_no_t account_no,
                     const tx_id_t& tx_id,
                     std::optional<side_write> side = std::nullopt)
            -> account_result;

        /// Converts a reservation into a permanent balance decrease. Logs
        /// TransferCommit.
        /// \param account_no account to debit.
        /// \param amount amount to debit, must equal the reservation.
        /// \param tx_id transfer owning the reservation.
        /// \param side optional record to write atomically.
        /// \return updated account, or not_found, protocol_violation if the
        ///         account holds no matching reservation, or
        ///         storage_failure.
        auto apply_debit(account_no_t account_no,
                         amount_t amount,
                         const tx_id_t& tx_id,
                         std::optional<side_write> side = std::nullopt)
            -> account_result;

        /// Permanently increases a balance. Logs Deposit without a
        /// transfer ID, TransferCommit with one.
        /// \param account_no account to credit.
        /// \param amount amount to credit, must be positive.
        /// \param tx_id transfer the credit belongs to, if any.
        /// \param side optional record to write atomically.
        /// \return updated account, or not_found, invalid_argument or
        ///         storage_failure.
        auto apply_credit(account_no_t account_no,
                          amount_t amount,
                          const std::optional<tx_id_t>& tx_id = std::nullopt,
                          std::optional<side_write> side = std::nullopt)
            -> account_result;

        /// Logs a transfer step that does not change the account, such as
        /// the prepare or abort of a credit.
        /// \param account_no account the step applies to.
        /// \param amount amount of the transfer.
        /// \param tx_id transfer ID.
        /// \param kind log entry kind.
        /// \param side optional record to write atomically.
        /// \return current account, or not_found or storage_failure. The
        ///         prepare of a credit is refused with invalid_argument if
        ///         applying it would overflow the balance.
        auto note(account_no_t account_no,
                  amount_t amount,
                  const tx_id_t& tx_id,
                  op_kind kind,
                  std::optional<side_write> side = std::nullopt)
            -> account_result;

        /// Withdraws funds in one step, with no window in which the
        /// intermediate reservation is visible. Logs Withdraw.
        /// \param account_no account to debit.
        /// \param amount amount to withdraw, must be positive.
        /// \return updated account, or not_found, insufficient_funds,
        ///         invalid_argument or storage_failure.
        auto withdraw(account_no_t account_no, amount_t amount)
            -> account_result;

        /// Moves funds between two accounts of this branch in one atomic
        /// write. Logs a single TransferLocal entry against the source.
        /// \param src_account account to debit.
        /// \param dst_account account to credit.
        /// \param amount amount to move, must be positive.
        /// \return updated source and destination accounts, or not_found,
        ///         insufficient_funds, invalid_argument or storage_failure.
        auto transfer(account_no_t src_account,
                      account_no_t dst_account,
                      amount_t amount) -> pair_result;

        /// Reads the operation log in sequence order.
        /// \param from_seq first sequence number to return.
        /// \param limit maximum number of entries, zero for no limit.
        /// \return log entries.
        auto read_log(uint64_t from_seq = 0, size_t limit = 0)
            -> std::vector<log_entry>;

        /// Reads a side record.
        /// \param key record key.
        /// \return record value, or std::nullopt if not present.
        auto get_side(const std::string& key) -> std::optional<buffer>;

        /// Returns every side record whose key starts with the prefix.
        /// \param prefix key prefix.
        /// \return key and value of each record, ordered by key.
        auto scan_side(const std::string& prefix)
            -> std::vector<std::pair<std::string, buffer>>;

        /// Writes or deletes a side record on its own.
        /// \param side record to write.
        /// \return true if the write succeeded.
        auto put_side(const side_write& side) -> bool;

      private:
        std::shared_ptr<logging::log> m_logger;

        std::unique_ptr<leveldb::DB> m_db;
        leveldb::ReadOptions m_read_options;
        leveldb::WriteOptions m_write_options;

        std::atomic<uint64_t> m_next_seq{0};

        std::mutex m_locks_mut;
        std::unordered_map<account_no_t, std::unique_ptr<std::mutex>>
            m_locks;

        auto account_lock(account_no_t account_no) -> std::mutex&;

        auto read_account(account_no_t account_no) -> std::optional<account>;

        void stage_account(leveldb::WriteBatch& batch, const account& acc);

        void stage_log(leveldb::WriteBatch& batch,
                       op_kind kind,
                       account_no_t account_no,
                       amount_t amount,
                       const std::optional<tx_id_t>& tx_id);

        static void stage_side(leveldb::WriteBatch& batch,
                               const std::optional<side_write>& side);

        auto commit(leveldb::WriteBatch& batch) -> bool;

        static auto account_key(account_no_t account_no) -> std::string;
        static auto log_key(uint64_t seq) -> std::string;
        static auto side_key(const std::string& key) -> std::string;
    };
}

#endif // BRANCHNET_SRC_BRANCH_LEDGER_STORE_H_
