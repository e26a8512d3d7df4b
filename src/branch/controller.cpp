// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "controller.hpp"

namespace branchnet::branch {
    controller::controller(size_t branch_id,
                           config::options opts,
                           std::shared_ptr<logging::log> logger)
        : m_branch_id(branch_id),
          m_opts(std::move(opts)),
          m_logger(std::move(logger)) {}

    controller::~controller() {
        quit();
    }

    auto controller::init() -> bool {
        if(m_branch_id >= m_opts.m_branch_names.size()) {
            m_logger->error("Branch index",
                            m_branch_id,
                            "is not configured");
            return false;
        }
        const auto& name = m_opts.m_branch_names[m_branch_id];
        const auto& endpoint = m_opts.m_branch_endpoints[m_branch_id];

        m_store = std::make_shared<ledger::store>(m_logger);
        if(auto err = m_store->open_db(m_opts.m_branch_db_dirs[m_branch_id])) {
            m_logger->error("Failed to open ledger:", err.value());
            return false;
        }

        m_engine = std::make_shared<engine::engine>(name, m_store, m_logger);
        if(m_opts.m_branch_preload[m_branch_id] && !m_engine->preload()) {
            m_logger->error("Failed to preload accounts");
            return false;
        }

        m_participant = std::make_shared<participant::participant>(m_store,
                                                                  m_opts,
                                                                  m_logger);
        m_coordinator = std::make_shared<coordinator::coordinator>(
            name,
            endpoint,
            m_store,
            m_engine,
            m_participant,
            [&](const network::endpoint_t& ep) {
                return remote_participant(ep);
            },
            m_opts,
            m_logger);

        // Debits the coordinator decided to commit must survive the
        // participant's abort-on-restart.
        if(!m_participant->init(m_coordinator->decided_commits())) {
            m_logger->error("Failed to recover participant state");
            return false;
        }
        auto resumed = m_coordinator->recover();
        if(resumed > 0) {
            m_logger->info("Resumed", resumed, "interrupted transfers");
        }

        auto rpc_srv = std::make_unique<server::rpc_server>(endpoint);
        m_server = std::make_unique<server>(m_engine,
                                            m_participant,
                                            m_coordinator,
                                            std::move(rpc_srv),
                                            m_opts.m_server_threads,
                                            m_logger);
        if(!m_server->init()) {
            m_logger->error("Failed to listen on",
                            network::to_string(endpoint));
            return false;
        }

        m_logger->info("Branch",
                       name,
                       "listening on",
                       network::to_string(endpoint));
        return true;
    }

    void controller::quit() {
        if(m_coordinator) {
            m_coordinator->stop();
        }
        m_server.reset();
        if(m_participant) {
            m_participant->stop();
        }
    }

    auto controller::get_engine() const -> std::shared_ptr<engine::engine> {
        return m_engine;
    }

    auto controller::get_participant() const
        -> std::shared_ptr<participant::participant> {
        return m_participant;
    }

    auto controller::get_coordinator() const
        -> std::shared_ptr<coordinator::coordinator> {
        return m_coordinator;
    }

    auto controller::remote_participant(const network::endpoint_t& endpoint)
        -> std::shared_ptr<participant::interface> {
        auto make = [&](const network::endpoint_t& ep) {
            return std::make_shared<participant::client>(
                ep,
                std::chrono::milliseconds(m_opts.m_prepare_timeout_ms),
                std::chrono::milliseconds(m_opts.m_rpc_call_timeout_ms),
                m_logger);
        };

        // Only configured branches keep a connection. Any other endpoint
        // gets a client that lives as long as the transfer using it.
        auto known = std::optional<network::endpoint_t>();
        for(const auto& ep : m_opts.m_branch_endpoints) {
            if(ep == endpoint) {
                known = ep;
                break;
            }
        }
        if(!known.has_value()) {
            for(const auto& ep : m_opts.m_branch_endpoints) {
                if(network::same_endpoint(ep, endpoint)) {
                    known = ep;
                    break;
                }
            }
        }
        if(!known.has_value()) {
            return make(endpoint);
        }

        std::unique_lock<std::mutex> l(m_remotes_mut);
        auto& remote = m_remotes[known.value()];
        if(!remote) {
            remote = make(known.value());
        }
        return remote;
    }
}
