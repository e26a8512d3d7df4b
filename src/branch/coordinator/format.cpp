// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "branch/ledger/format.hpp"
#include "util/serialization/format.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const coordinator::result& r)
        -> serializer& {
        return ser << r.m_outcome << r.m_tx_id << r.m_reason;
    }

    auto operator>>(serializer& deser, coordinator::result& r)
        -> serializer& {
        deser >> r.m_outcome >> r.m_tx_id >> r.m_reason;
        if(r.m_outcome > coordinator::outcome::unresolved) {
            deser.invalidate();
        }
        return deser;
    }

    auto operator<<(serializer& ser, const coordinator::record& r)
        -> serializer& {
        return ser << r.m_tx_id << r.m_src_account << r.m_dst_endpoint
                   << r.m_dst_account << r.m_amount << r.m_phase
                   << r.m_unresolved << r.m_reason << r.m_created
                   << r.m_deliver_src << r.m_deliver_dst;
    }

    auto operator>>(serializer& deser, coordinator::record& r)
        -> serializer& {
        deser >> r.m_tx_id >> r.m_src_account >> r.m_dst_endpoint
            >> r.m_dst_account >> r.m_amount >> r.m_phase >> r.m_unresolved
            >> r.m_reason >> r.m_created >> r.m_deliver_src
            >> r.m_deliver_dst;
        if(r.m_phase > coordinator::tx_phase::aborting) {
            deser.invalidate();
        }
        return deser;
    }
}
