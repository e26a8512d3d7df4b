// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

namespace branchnet::participant {
    auto prepare_params::operator==(const prepare_params& rhs) const -> bool {
        return m_tx_id == rhs.m_tx_id && m_side == rhs.m_side
            && m_account_no == rhs.m_account_no && m_amount == rhs.m_amount;
    }
}
