// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_PARTICIPANT_CLIENT_H_
#define BRANCHNET_SRC_BRANCH_PARTICIPANT_CLIENT_H_

#include "branch/client/client.hpp"
#include "interface.hpp"

#include <chrono>
#include <memory>

namespace branchnet::participant {
    /// Participant of a remote branch, reached through its listener.
    /// Connection failures are reported as peer_unreachable and calls
    /// exceeding their time bound as timeout.
    class client final : public interface {
      public:
        /// Constructor.
        /// \param endpoint listener of the remote branch.
        /// \param prepare_timeout time bound of prepare calls.
        /// \param call_timeout time bound of commit and abort calls.
        /// \param logger log instance.
        client(network::endpoint_t endpoint,
               std::chrono::milliseconds prepare_timeout,
               std::chrono::milliseconds call_timeout,
               std::shared_ptr<logging::log> logger);

        client() = delete;
        client(const client&) = delete;
        auto operator=(const client&) -> client& = delete;
        client(client&&) = delete;
        auto operator=(client&&) -> client& = delete;

        ~client() override = default;

        auto prepare(const prepare_params& params)
            -> std::optional<error> override;

        auto commit(const ledger::tx_id_t& tx_id)
            -> std::optional<error> override;

        auto abort(const ledger::tx_id_t& tx_id)
            -> std::optional<error> override;

      private:
        branch::client m_client;
        std::chrono::milliseconds m_prepare_timeout;
        std::chrono::milliseconds m_call_timeout;
    };
}

#endif // BRANCHNET_SRC_BRANCH_PARTICIPANT_CLIENT_H_
