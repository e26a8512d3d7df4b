// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_COORDINATOR_FORMAT_H_
#define BRANCHNET_SRC_BRANCH_COORDINATOR_FORMAT_H_

#include "messages.hpp"
#include "util/serialization/serializer.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const coordinator::result& r)
        -> serializer&;
    auto operator>>(serializer& deser, coordinator::result& r)
        -> serializer&;

    auto operator<<(serializer& ser, const coordinator::record& r)
        -> serializer&;
    auto operator>>(serializer& deser, coordinator::record& r)
        -> serializer&;
}

#endif // BRANCHNET_SRC_BRANCH_COORDINATOR_FORMAT_H_
