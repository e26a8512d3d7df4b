// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_FORMAT_H_
#define BRANCHNET_SRC_BRANCH_FORMAT_H_

#include "branch/coordinator/format.hpp"
#include "branch/ledger/format.hpp"
#include "branch/participant/format.hpp"
#include "messages.hpp"
#include "util/serialization/format.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const branch::balance_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::balance_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::deposit_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::deposit_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::withdraw_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::withdraw_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::transfer_local_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::transfer_local_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::prepare_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::prepare_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::commit_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::commit_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::abort_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::abort_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::inter_branch_transfer_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser,
                    branch::inter_branch_transfer_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::create_account_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::create_account_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::resolve_unresolved_request& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::resolve_unresolved_request& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::balance_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::balance_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::deposit_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::deposit_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::withdraw_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::withdraw_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::transfer_local_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::transfer_local_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::prepare_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::prepare_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::commit_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::commit_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::abort_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::abort_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::inter_branch_transfer_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser,
                    branch::inter_branch_transfer_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser, const branch::list_accounts_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::list_accounts_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::create_account_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::create_account_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::list_unresolved_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser, branch::list_unresolved_response& msg)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const branch::resolve_unresolved_response& msg)
        -> serializer&;
    auto operator>>(serializer& deser,
                    branch::resolve_unresolved_response& msg)
        -> serializer&;
}

#endif // BRANCHNET_SRC_BRANCH_FORMAT_H_
