// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

namespace branchnet::ledger {
    auto account::operator==(const account& rhs) const -> bool {
        return m_account_no == rhs.m_account_no && m_name == rhs.m_name
            && m_balance == rhs.m_balance && m_reserved == rhs.m_reserved
            && m_version == rhs.m_version
            && m_reserved_by == rhs.m_reserved_by;
    }

    auto log_entry::operator==(const log_entry& rhs) const -> bool {
        return m_seq == rhs.m_seq && m_timestamp == rhs.m_timestamp
            && m_kind == rhs.m_kind && m_account_no == rhs.m_account_no
            && m_amount == rhs.m_amount && m_tx_id == rhs.m_tx_id;
    }
}
