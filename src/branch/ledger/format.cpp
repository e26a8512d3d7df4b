// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "util/serialization/format.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const error& err) -> serializer& {
        return ser << err.m_code << err.m_message;
    }

    auto operator>>(serializer& deser, error& err) -> serializer& {
        deser >> err.m_code >> err.m_message;
        if(err.m_code > error_code::storage_failure) {
            deser.invalidate();
        }
        return deser;
    }

    auto operator<<(serializer& ser, const ledger::account& acc)
        -> serializer& {
        return ser << acc.m_account_no << acc.m_name << acc.m_balance
                   << acc.m_reserved << acc.m_version << acc.m_reserved_by;
    }

    auto operator>>(serializer& deser, ledger::account& acc) -> serializer& {
        return deser >> acc.m_account_no >> acc.m_name >> acc.m_balance
            >> acc.m_reserved >> acc.m_version >> acc.m_reserved_by;
    }

    auto operator<<(serializer& ser, const ledger::log_entry& entry)
        -> serializer& {
        return ser << entry.m_seq << entry.m_timestamp << entry.m_kind
                   << entry.m_account_no << entry.m_amount << entry.m_tx_id;
    }

    auto operator>>(serializer& deser, ledger::log_entry& entry)
        -> serializer& {
        deser >> entry.m_seq >> entry.m_timestamp >> entry.m_kind
            >> entry.m_account_no >> entry.m_amount >> entry.m_tx_id;
        if(entry.m_kind > ledger::op_kind::transfer_abort) {
            deser.invalidate();
        }
        return deser;
    }
}
