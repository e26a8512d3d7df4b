// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

namespace branchnet::participant {
    client::client(network::endpoint_t endpoint,
                   std::chrono::milliseconds prepare_timeout,
                   std::chrono::milliseconds call_timeout,
                   std::shared_ptr<logging::log> logger)
        : m_client(std::move(endpoint), call_timeout, std::move(logger)),
          m_prepare_timeout(prepare_timeout),
          m_call_timeout(call_timeout) {}

    auto client::prepare(const prepare_params& params)
        -> std::optional<error> {
        return m_client.prepare(params, m_prepare_timeout);
    }

    auto client::commit(const ledger::tx_id_t& tx_id)
        -> std::optional<error> {
        return m_client.commit(tx_id, m_call_timeout);
    }

    auto client::abort(const ledger::tx_id_t& tx_id)
        -> std::optional<error> {
        return m_client.abort(tx_id, m_call_timeout);
    }
}
