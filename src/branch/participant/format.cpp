// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "util/serialization/format.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const participant::prepare_params& p)
        -> serializer& {
        return ser << p.m_tx_id << p.m_side << p.m_account_no << p.m_amount;
    }

    auto operator>>(serializer& deser, participant::prepare_params& p)
        -> serializer& {
        deser >> p.m_tx_id >> p.m_side >> p.m_account_no >> p.m_amount;
        if(p.m_side > participant::side::credit) {
            deser.invalidate();
        }
        return deser;
    }

    auto operator<<(serializer& ser, const participant::record& r)
        -> serializer& {
        return ser << r.m_side << r.m_account_no << r.m_amount << r.m_state
                   << r.m_deadline << r.m_resolved_at;
    }

    auto operator>>(serializer& deser, participant::record& r)
        -> serializer& {
        deser >> r.m_side >> r.m_account_no >> r.m_amount >> r.m_state
            >> r.m_deadline >> r.m_resolved_at;
        if(r.m_side > participant::side::credit
           || r.m_state > participant::tx_state::aborted) {
            deser.invalidate();
        }
        return deser;
    }
}
