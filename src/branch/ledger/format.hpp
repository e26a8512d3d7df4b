// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_LEDGER_FORMAT_H_
#define BRANCHNET_SRC_BRANCH_LEDGER_FORMAT_H_

#include "branch/error.hpp"
#include "messages.hpp"
#include "util/serialization/serializer.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const error& err) -> serializer&;
    auto operator>>(serializer& deser, error& err) -> serializer&;

    auto operator<<(serializer& ser, const ledger::account& acc)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::account& acc) -> serializer&;

    auto operator<<(serializer& ser, const ledger::log_entry& entry)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::log_entry& entry)
        -> serializer&;
}

#endif // BRANCHNET_SRC_BRANCH_LEDGER_FORMAT_H_
