// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_CONTROLLER_H_
#define BRANCHNET_SRC_BRANCH_CONTROLLER_H_

#include "branch/coordinator/coordinator.hpp"
#include "branch/engine/engine.hpp"
#include "branch/ledger/store.hpp"
#include "branch/participant/client.hpp"
#include "branch/participant/participant.hpp"
#include "branch/server/server.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace branchnet::branch {
    /// \brief Context of one branch process.
    ///
    /// Created once at startup and owns every component of the branch:
    /// the ledger store, the engine, the participant, the coordinator and
    /// the listener. Components receive what they need from it explicitly.
    class controller {
      public:
        /// Constructor.
        /// \param branch_id index of the branch in the configuration.
        /// \param opts configuration options.
        /// \param logger log instance.
        controller(size_t branch_id,
                   config::options opts,
                   std::shared_ptr<logging::log> logger);

        controller() = delete;
        controller(const controller&) = delete;
        auto operator=(const controller&) -> controller& = delete;
        controller(controller&&) = delete;
        auto operator=(controller&&) -> controller& = delete;

        ~controller();

        /// Opens the ledger, preloads sample accounts if configured,
        /// recovers participant and coordinator state and starts the
        /// listener.
        /// \return true if the branch is serving.
        auto init() -> bool;

        /// Stops the listener and background work.
        void quit();

        /// Returns the engine of the branch.
        [[nodiscard]] auto get_engine() const
            -> std::shared_ptr<engine::engine>;

        /// Returns the participant of the branch.
        [[nodiscard]] auto get_participant() const
            -> std::shared_ptr<participant::participant>;

        /// Returns the coordinator of the branch.
        [[nodiscard]] auto get_coordinator() const
            -> std::shared_ptr<coordinator::coordinator>;

      private:
        size_t m_branch_id;
        config::options m_opts;
        std::shared_ptr<logging::log> m_logger;

        std::shared_ptr<ledger::store> m_store;
        std::shared_ptr<engine::engine> m_engine;
        std::shared_ptr<participant::participant> m_participant;
        std::shared_ptr<coordinator::coordinator> m_coordinator;
        std::unique_ptr<server> m_server;

        std::mutex m_remotes_mut;
        /// Clients of configured branches, keyed by configured endpoint.
        std::map<network::endpoint_t, std::shared_ptr<participant::client>>
            m_remotes;

        auto remote_participant(const network::endpoint_t& endpoint)
            -> std::shared_ptr<participant::interface>;
    };
}

#endif // BRANCHNET_SRC_BRANCH_CONTROLLER_H_
