// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_BRANCH_SERVER_SERVER_H_
#define BRANCHNET_SRC_BRANCH_SERVER_SERVER_H_

#include "branch/coordinator/coordinator.hpp"
#include "branch/engine/engine.hpp"
#include "branch/format.hpp"
#include "branch/messages.hpp"
#include "branch/participant/interface.hpp"
#include "util/common/logging.hpp"
#include "util/common/thread_pool.hpp"
#include "util/rpc/tcp_server.hpp"

#include <memory>

namespace branchnet::branch {
    /// \brief Listener of a branch.
    ///
    /// Decodes each request, routes it by its variant alternative to the
    /// engine, the participant or the coordinator and answers with exactly
    /// one response. Requests are handled on worker threads so that a slow
    /// request never holds up other connections. Peer requests (prepare,
    /// commit, abort) have their own pool so that two branches running
    /// transfers towards each other cannot exhaust each other's workers.
    class server {
      public:
        /// RPC server type the listener runs on.
        using rpc_server = rpc::tcp_server<request, response>;

        /// Constructor.
        /// \param eng transaction engine of the branch.
        /// \param part participant of the branch.
        /// \param coord coordinator of the branch.
        /// \param srv RPC server, not yet initialized.
        /// \param client_threads maximum number of threads serving client
        ///                       requests.
        /// \param logger log instance.
        server(std::shared_ptr<engine::engine> eng,
               std::shared_ptr<participant::interface> part,
               std::shared_ptr<coordinator::coordinator> coord,
               std::unique_ptr<rpc_server> srv,
               size_t client_threads,
               std::shared_ptr<logging::log> logger);

        server() = delete;
        server(const server&) = delete;
        auto operator=(const server&) -> server& = delete;
        server(server&&) = delete;
        auto operator=(server&&) -> server& = delete;

        ~server() = default;

        /// Starts listening.
        /// \return false if the listener could not bind its endpoint.
        auto init() -> bool;

        /// Executes one request synchronously.
        /// \param req request to execute.
        /// \return response to the request.
        auto handle(request req) -> response;

      private:
        std::shared_ptr<engine::engine> m_engine;
        std::shared_ptr<participant::interface> m_participant;
        std::shared_ptr<coordinator::coordinator> m_coordinator;
        std::shared_ptr<logging::log> m_logger;

        thread_pool m_peer_pool;
        thread_pool m_client_pool;

        // Destroyed first so that no request arrives once the pools
        // are gone.
        std::unique_ptr<rpc_server> m_srv;

        auto enqueue(request req,
                     const rpc_server::response_callback_type& callback)
            -> bool;
    };
}

#endif // BRANCHNET_SRC_BRANCH_SERVER_SERVER_H_
