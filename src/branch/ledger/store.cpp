// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store.hpp"

#include "format.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

#include <chrono>
#include <limits>

namespace branchnet::ledger {
    namespace {
        constexpr char account_prefix = 'a';
        constexpr char log_prefix = 'l';
        constexpr char side_prefix = 's';

        auto encode_key(char prefix, uint64_t val) -> std::string {
            auto key = std::string(1 + sizeof(val), '\0');
            key[0] = prefix;
            // Big-endian so that LevelDB's bytewise ordering matches the
            // numeric ordering.
            for(size_t i{0}; i < sizeof(val); i++) {
                key[1 + i] = static_cast<char>(
                    (val >> (8 * (sizeof(val) - 1 - i))) & 0xff);
            }
            return key;
        }

        auto to_slice(const buffer& buf) -> leveldb::Slice {
            const auto v = buf.view();
            return {v.data(), v.size()};
        }

        auto to_buffer(const std::string& val) -> buffer {
            return buffer(val.data(), val.size());
        }

        auto not_found(account_no_t account_no) -> error {
            return error{error_code::not_found,
                         "Account " + std::to_string(account_no)
                             + " does not exist"};
        }

        auto insufficient_funds(const account& acc, amount_t amount)
            -> error {
            return error{error_code::insufficient_funds,
                         "Account " + std::to_string(acc.m_account_no)
                             + " has "
                             + std::to_string(acc.m_balance - acc.m_reserved)
                             + " available, " + std::to_string(amount)
                             + " requested"};
        }

        /// Refuses a credit that would push the balance past the largest
        /// representable amount.
        auto credit_overflow(const account& acc, amount_t amount)
            -> std::optional<error> {
            if(amount > std::numeric_limits<amount_t>::max() - acc.m_balance) {
                return error{error_code::invalid_argument,
                             "Crediting " + std::to_string(amount)
                                 + " to account "
                                 + std::to_string(acc.m_account_no)
                                 + " overflows its balance"};
            }
            return std::nullopt;
        }

        auto non_positive(amount_t amount) -> error {
            return error{error_code::invalid_argument,
                         "Amount must be positive, got "
                             + std::to_string(amount)};
        }

        auto write_failed() -> error {
            return error{error_code::storage_failure,
                         "Ledger write failed"};
        }

        auto now_ms() -> uint64_t {
            return static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count());
        }
    }

    store::store(std::shared_ptr<logging::log> logger)
        : m_logger(std::move(logger)) {}

    auto store::open_db(const std::string& db_dir)
        -> std::optional<std::string> {
        leveldb::Options opt;
        opt.create_if_missing = true;

        leveldb::DB* db_ptr{};
        const auto res = leveldb::DB::Open(opt, db_dir, &db_ptr);
        if(!res.ok()) {
            return res.ToString();
        }
        m_db.reset(db_ptr);

        // Continue the operation log after its last entry
        auto it = std::unique_ptr<leveldb::Iterator>(
            m_db->NewIterator(m_read_options));
        it->Seek(std::string(1, static_cast<char>(log_prefix + 1)));
        if(it->Valid()) {
            it->Prev();
        } else {
            it->SeekToLast();
        }
        if(it->Valid() && it->key().size() > 0
           && it->key()[0] == log_prefix) {
            auto buf = to_buffer(it->value().ToString());
            auto entry = from_buffer<log_entry>(buf);
            if(!entry.has_value()) {
                return "Unreadable operation log entry";
            }
            m_next_seq = entry->m_seq + 1;
        }
        if(!it->status().ok()) {
            return it->status().ToString();
        }

        m_logger->debug("Opened ledger at",
                        db_dir,
                        "next log sequence",
                        m_next_seq.load());
        return std::nullopt;
    }

    auto store::get(account_no_t account_no) -> account_result {
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }
        return acc.value();
    }

    auto store::list_accounts() -> std::vector<account> {
        auto ret = std::vector<account>();
        auto it = std::unique_ptr<leveldb::Iterator>(
            m_db->NewIterator(m_read_options));
        for(it->Seek(std::string(1, account_prefix));
            it->Valid() && it->key()[0] == account_prefix;
            it->Next()) {
            auto buf = to_buffer(it->value().ToString());
            auto acc = from_buffer<account>(buf);
            if(!acc.has_value()) {
                m_logger->fatal("Unreadable account record in ledger");
            }
            ret.emplace_back(std::move(acc.value()));
        }
        return ret;
    }

    auto store::empty() -> bool {
        auto it = std::unique_ptr<leveldb::Iterator>(
            m_db->NewIterator(m_read_options));
        it->Seek(std::string(1, account_prefix));
        return !(it->Valid() && it->key()[0] == account_prefix);
    }

    auto store::create_account(account_no_t account_no,
                               std::string name,
                               amount_t balance) -> account_result {
        if(balance < 0) {
            return error{error_code::invalid_argument,
                         "Initial balance must not be negative"};
        }
        std::unique_lock<std::mutex> l(account_lock(account_no));
        if(read_account(account_no).has_value()) {
            return error{error_code::account_exists,
                         "Account " + std::to_string(account_no)
                             + " already exists"};
        }
        auto acc = account{account_no, std::move(name), balance, 0, 1, {}};
        leveldb::WriteBatch batch;
        stage_account(batch, acc);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc;
    }

    auto store::reserve(account_no_t account_no,
                        amount_t amount,
                        const tx_id_t& tx_id,
                        std::optional<side_write> side) -> account_result {
        if(amount <= 0) {
            return non_positive(amount);
        }
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }
        if(acc->m_reserved_by.has_value()) {
            if(acc->m_reserved_by.value() != tx_id) {
                return error{error_code::tx_conflict,
                             "Account " + std::to_string(account_no)
                                 + " is reserved by transfer "
                                 + acc->m_reserved_by.value()};
            }
            if(acc->m_reserved != amount) {
                return error{error_code::protocol_violation,
                             "Transfer " + tx_id
                                 + " already reserved a different amount"};
            }
            return acc.value();
        }
        if(acc->m_balance - acc->m_reserved < amount) {
            return insufficient_funds(acc.value(), amount);
        }

        acc->m_reserved += amount;
        acc->m_reserved_by = tx_id;
        acc->m_version++;

        leveldb::WriteBatch batch;
        stage_account(batch, acc.value());
        stage_log(batch, op_kind::transfer_prepare, account_no, amount, tx_id);
        stage_side(batch, side);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc.value();
    }

    auto store::release(account_no_t account_no,
                        const tx_id_t& tx_id,
                        std::optional<side_write> side) -> account_result {
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }

        leveldb::WriteBatch batch;
        amount_t released{0};
        if(acc->m_reserved_by == tx_id) {
            released = acc->m_reserved;
            acc->m_reserved = 0;
            acc->m_reserved_by.reset();
            acc->m_version++;
            stage_account(batch, acc.value());
        }
        stage_log(batch, op_kind::transfer_abort, account_no, released, tx_id);
        stage_side(batch, side);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc.value();
    }

    auto store::apply_debit(account_no_t account_no,
                            amount_t amount,
                            const tx_id_t& tx_id,
                            std::optional<side_write> side)
        -> account_result {
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }
        if(acc->m_reserved_by != tx_id || acc->m_reserved != amount) {
            return error{error_code::protocol_violation,
                         "Account " + std::to_string(account_no)
                             + " holds no reservation of "
                             + std::to_string(amount) + " for transfer "
                             + tx_id};
        }

        acc->m_balance -= amount;
        acc->m_reserved = 0;
        acc->m_reserved_by.reset();
        acc->m_version++;

        leveldb::WriteBatch batch;
        stage_account(batch, acc.value());
        stage_log(batch, op_kind::transfer_commit, account_no, amount, tx_id);
        stage_side(batch, side);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc.value();
    }

    auto store::apply_credit(account_no_t account_no,
                             amount_t amount,
                             const std::optional<tx_id_t>& tx_id,
                             std::optional<side_write> side)
        -> account_result {
        if(amount <= 0) {
            return non_positive(amount);
        }
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }
        if(auto err = credit_overflow(acc.value(), amount)) {
            return err.value();
        }

        acc->m_balance += amount;
        acc->m_version++;

        const auto kind = tx_id.has_value() ? op_kind::transfer_commit
                                            : op_kind::deposit;
        leveldb::WriteBatch batch;
        stage_account(batch, acc.value());
        stage_log(batch, kind, account_no, amount, tx_id);
        stage_side(batch, side);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc.value();
    }

    auto store::note(account_no_t account_no,
                     amount_t amount,
                     const tx_id_t& tx_id,
                     op_kind kind,
                     std::optional<side_write> side) -> account_result {
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }
        if(kind == op_kind::transfer_prepare) {
            if(auto err = credit_overflow(acc.value(), amount)) {
                return err.value();
            }
        }
        leveldb::WriteBatch batch;
        stage_log(batch, kind, account_no, amount, tx_id);
        stage_side(batch, side);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc.value();
    }

    auto store::withdraw(account_no_t account_no, amount_t amount)
        -> account_result {
        if(amount <= 0) {
            return non_positive(amount);
        }
        std::unique_lock<std::mutex> l(account_lock(account_no));
        auto acc = read_account(account_no);
        if(!acc.has_value()) {
            return not_found(account_no);
        }
        if(acc->m_balance - acc->m_reserved < amount) {
            return insufficient_funds(acc.value(), amount);
        }

        acc->m_balance -= amount;
        acc->m_version++;

        leveldb::WriteBatch batch;
        stage_account(batch, acc.value());
        stage_log(batch, op_kind::withdraw, account_no, amount, std::nullopt);
        if(!commit(batch)) {
            return write_failed();
        }
        return acc.value();
    }

    auto store::transfer(account_no_t src_account,
                         account_no_t dst_account,
                         amount_t amount) -> pair_result {
        if(amount <= 0) {
            return non_positive(amount);
        }
        if(src_account == dst_account) {
            return error{error_code::invalid_argument,
                         "Source and destination accounts are the same"};
        }
        std::scoped_lock<std::mutex, std::mutex> l(account_lock(src_account),
                                                   account_lock(dst_account));
        auto src = read_account(src_account);
        if(!src.has_value()) {
            return not_found(src_account);
        }
        auto dst = read_account(dst_account);
        if(!dst.has_value()) {
            return not_found(dst_account);
        }
        if(src->m_balance - src->m_reserved < amount) {
            return insufficient_funds(src.value(), amount);
        }
        if(auto err = credit_overflow(dst.value(), amount)) {
            return err.value();
        }

        src->m_balance -= amount;
        src->m_version++;
        dst->m_balance += amount;
        dst->m_version++;

        leveldb::WriteBatch batch;
        stage_account(batch, src.value());
        stage_account(batch, dst.value());
        stage_log(batch,
                  op_kind::transfer_local,
                  src_account,
                  amount,
                  std::nullopt);
        if(!commit(batch)) {
            return write_failed();
        }
        return std::make_pair(std::move(src.value()), std::move(dst.value()));
    }

    auto store::read_log(uint64_t from_seq, size_t limit)
        -> std::vector<log_entry> {
        auto ret = std::vector<log_entry>();
        auto it = std::unique_ptr<leveldb::Iterator>(
            m_db->NewIterator(m_read_options));
        for(it->Seek(log_key(from_seq));
            it->Valid() && it->key()[0] == log_prefix;
            it->Next()) {
            if(limit != 0 && ret.size() >= limit) {
                break;
            }
            auto buf = to_buffer(it->value().ToString());
            auto entry = from_buffer<log_entry>(buf);
            if(!entry.has_value()) {
                m_logger->fatal("Unreadable operation log entry in ledger");
            }
            ret.emplace_back(std::move(entry.value()));
        }
        return ret;
    }

    auto store::get_side(const std::string& key) -> std::optional<buffer> {
        std::string val;
        const auto res = m_db->Get(m_read_options, side_key(key), &val);
        if(res.IsNotFound()) {
            return std::nullopt;
        }
        if(!res.ok()) {
            m_logger->fatal("Failed to read ledger record",
                            key,
                            res.ToString());
        }
        return to_buffer(val);
    }

    auto store::scan_side(const std::string& prefix)
        -> std::vector<std::pair<std::string, buffer>> {
        auto ret = std::vector<std::pair<std::string, buffer>>();
        const auto start = side_key(prefix);
        auto it = std::unique_ptr<leveldb::Iterator>(
            m_db->NewIterator(m_read_options));
        for(it->Seek(start); it->Valid() && it->key().starts_with(start);
            it->Next()) {
            auto key = it->key().ToString().substr(1);
            ret.emplace_back(std::move(key),
                             to_buffer(it->value().ToString()));
        }
        return ret;
    }

    auto store::put_side(const side_write& side) -> bool {
        leveldb::WriteBatch batch;
        stage_side(batch, side);
        return commit(batch);
    }

    auto store::account_lock(account_no_t account_no) -> std::mutex& {
        std::unique_lock<std::mutex> l(m_locks_mut);
        auto& mut = m_locks[account_no];
        if(!mut) {
            mut = std::make_unique<std::mutex>();
        }
        return *mut;
    }

    auto store::read_account(account_no_t account_no)
        -> std::optional<account> {
        std::string val;
        const auto res
            = m_db->Get(m_read_options, account_key(account_no), &val);
        if(res.IsNotFound()) {
            return std::nullopt;
        }
        if(!res.ok()) {
            m_logger->fatal("Failed to read account",
                            account_no,
                            res.ToString());
        }
        auto buf = to_buffer(val);
        auto acc = from_buffer<account>(buf);
        if(!acc.has_value()) {
            m_logger->fatal("Unreadable record for account", account_no);
        }
        return acc;
    }

    void store::stage_account(leveldb::WriteBatch& batch, const account& acc) {
        const auto buf = make_buffer(acc);
        batch.Put(account_key(acc.m_account_no), to_slice(buf));
    }

    void store::stage_log(leveldb::WriteBatch& batch,
                          op_kind kind,
                          account_no_t account_no,
                          amount_t amount,
                          const std::optional<tx_id_t>& tx_id) {
        const auto entry = log_entry{m_next_seq++,
                                     now_ms(),
                                     kind,
                                     account_no,
                                     amount,
                                     tx_id};
        const auto buf = make_buffer(entry);
        batch.Put(log_key(entry.m_seq), to_slice(buf));
    }

    void store::stage_side(leveldb::WriteBatch& batch,
                           const std::optional<side_write>& side) {
        if(!side.has_value()) {
            return;
        }
        if(side->m_value.has_value()) {
            batch.Put(side_key(side->m_key), to_slice(side->m_value.value()));
        } else {
            batch.Delete(side_key(side->m_key));
        }
    }

    auto store::commit(leveldb::WriteBatch& batch) -> bool {
        const auto res = m_db->Write(m_write_options, &batch);
        if(!res.ok()) {
            m_logger->error("Ledger write failed:", res.ToString());
            return false;
        }
        return true;
    }

    auto store::account_key(account_no_t account_no) -> std::string {
        return encode_key(account_prefix, account_no);
    }

    auto store::log_key(uint64_t seq) -> std::string {
        return encode_key(log_prefix, seq);
    }

    auto store::side_key(const std::string& key) -> std::string {
        return side_prefix + key;
    }
}
