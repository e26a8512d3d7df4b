// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, const branch::balance_request& msg)
        -> serializer& {
        return ser << msg.m_account_no;
    }

    auto operator>>(serializer& deser, branch::balance_request& msg)
        -> serializer& {
        return deser >> msg.m_account_no;
    }

    auto operator<<(serializer& ser, const branch::deposit_request& msg)
        -> serializer& {
        return ser << msg.m_account_no << msg.m_amount;
    }

    auto operator>>(serializer& deser, branch::deposit_request& msg)
        -> serializer& {
        return deser >> msg.m_account_no >> msg.m_amount;
    }

    auto operator<<(serializer& ser, const branch::withdraw_request& msg)
        -> serializer& {
        return ser << msg.m_account_no << msg.m_amount;
    }

    auto operator>>(serializer& deser, branch::withdraw_request& msg)
        -> serializer& {
        return deser >> msg.m_account_no >> msg.m_amount;
    }

    auto operator<<(serializer& ser, const branch::transfer_local_request& msg)
        -> serializer& {
        return ser << msg.m_src_account << msg.m_dst_account << msg.m_amount;
    }

    auto operator>>(serializer& deser, branch::transfer_local_request& msg)
        -> serializer& {
        return deser >> msg.m_src_account >> msg.m_dst_account >> msg.m_amount;
    }

    auto operator<<(serializer& ser, const branch::prepare_request& msg)
        -> serializer& {
        return ser << msg.m_params;
    }

    auto operator>>(serializer& deser, branch::prepare_request& msg)
        -> serializer& {
        return deser >> msg.m_params;
    }

    auto operator<<(serializer& ser, const branch::commit_request& msg)
        -> serializer& {
        return ser << msg.m_tx_id;
    }

    auto operator>>(serializer& deser, branch::commit_request& msg)
        -> serializer& {
        return deser >> msg.m_tx_id;
    }

    auto operator<<(serializer& ser, const branch::abort_request& msg)
        -> serializer& {
        return ser << msg.m_tx_id;
    }

    auto operator>>(serializer& deser, branch::abort_request& msg)
        -> serializer& {
        return deser >> msg.m_tx_id;
    }

    auto operator<<(serializer& ser,
                    const branch::inter_branch_transfer_request& msg)
        -> serializer& {
        return ser << msg.m_tx_id << msg.m_src_account << msg.m_dst_endpoint
                   << msg.m_dst_account << msg.m_amount;
    }

    auto operator>>(serializer& deser,
                    branch::inter_branch_transfer_request& msg)
        -> serializer& {
        return deser >> msg.m_tx_id >> msg.m_src_account >> msg.m_dst_endpoint
            >> msg.m_dst_account >> msg.m_amount;
    }

    auto operator<<(serializer& ser, const branch::create_account_request& msg)
        -> serializer& {
        return ser << msg.m_account_no << msg.m_name << msg.m_balance;
    }

    auto operator>>(serializer& deser, branch::create_account_request& msg)
        -> serializer& {
        return deser >> msg.m_account_no >> msg.m_name >> msg.m_balance;
    }

    auto operator<<(serializer& ser,
                    const branch::resolve_unresolved_request& msg)
        -> serializer& {
        return ser << msg.m_tx_id;
    }

    auto operator>>(serializer& deser, branch::resolve_unresolved_request& msg)
        -> serializer& {
        return deser >> msg.m_tx_id;
    }

    auto operator<<(serializer& ser, const branch::balance_response& msg)
        -> serializer& {
        return ser << msg.m_account;
    }

    auto operator>>(serializer& deser, branch::balance_response& msg)
        -> serializer& {
        return deser >> msg.m_account;
    }

    auto operator<<(serializer& ser, const branch::deposit_response& msg)
        -> serializer& {
        return ser << msg.m_account;
    }

    auto operator>>(serializer& deser, branch::deposit_response& msg)
        -> serializer& {
        return deser >> msg.m_account;
    }

    auto operator<<(serializer& ser, const branch::withdraw_response& msg)
        -> serializer& {
        return ser << msg.m_account;
    }

    auto operator>>(serializer& deser, branch::withdraw_response& msg)
        -> serializer& {
        return deser >> msg.m_account;
    }

    auto operator<<(serializer& ser,
                    const branch::transfer_local_response& msg)
        -> serializer& {
        return ser << msg.m_src_account << msg.m_dst_account;
    }

    auto operator>>(serializer& deser, branch::transfer_local_response& msg)
        -> serializer& {
        return deser >> msg.m_src_account >> msg.m_dst_account;
    }

    auto operator<<(serializer& ser, const branch::prepare_response& msg)
        -> serializer& {
        return ser << msg.m_prepared;
    }

    auto operator>>(serializer& deser, branch::prepare_response& msg)
        -> serializer& {
        return deser >> msg.m_prepared;
    }

    auto operator<<(serializer& ser, const branch::commit_response& msg)
        -> serializer& {
        return ser << msg.m_committed;
    }

    auto operator>>(serializer& deser, branch::commit_response& msg)
        -> serializer& {
        return deser >> msg.m_committed;
    }

    auto operator<<(serializer& ser, const branch::abort_response& msg)
        -> serializer& {
        return ser << msg.m_aborted;
    }

    auto operator>>(serializer& deser, branch::abort_response& msg)
        -> serializer& {
        return deser >> msg.m_aborted;
    }

    auto operator<<(serializer& ser,
                    const branch::inter_branch_transfer_response& msg)
        -> serializer& {
        return ser << msg.m_result;
    }

    auto operator>>(serializer& deser,
                    branch::inter_branch_transfer_response& msg)
        -> serializer& {
        return deser >> msg.m_result;
    }

    auto operator<<(serializer& ser, const branch::list_accounts_response& msg)
        -> serializer& {
        return ser << msg.m_accounts;
    }

    auto operator>>(serializer& deser, branch::list_accounts_response& msg)
        -> serializer& {
        return deser >> msg.m_accounts;
    }

    auto operator<<(serializer& ser,
                    const branch::create_account_response& msg)
        -> serializer& {
        return ser << msg.m_account;
    }

    auto operator>>(serializer& deser, branch::create_account_response& msg)
        -> serializer& {
        return deser >> msg.m_account;
    }

    auto operator<<(serializer& ser,
                    const branch::list_unresolved_response& msg)
        -> serializer& {
        return ser << msg.m_records;
    }

    auto operator>>(serializer& deser, branch::list_unresolved_response& msg)
        -> serializer& {
        return deser >> msg.m_records;
    }

    auto operator<<(serializer& ser,
                    const branch::resolve_unresolved_response& msg)
        -> serializer& {
        return ser << msg.m_result;
    }

    auto operator>>(serializer& deser,
                    branch::resolve_unresolved_response& msg)
        -> serializer& {
        return deser >> msg.m_result;
    }
}
