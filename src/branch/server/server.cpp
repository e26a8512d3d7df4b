// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server.hpp"

#include "util/common/variant_overloaded.hpp"

namespace branchnet::branch {
    namespace {
        template<typename T>
        auto account_reply(ledger::store::account_result res) -> response {
            if(auto* err = std::get_if<error>(&res)) {
                return std::move(*err);
            }
            return T{std::get<ledger::account>(std::move(res))};
        }

        auto is_peer_request(const request& req) -> bool {
            return std::holds_alternative<prepare_request>(req)
                || std::holds_alternative<commit_request>(req)
                || std::holds_alternative<abort_request>(req);
        }
    }

    server::server(std::shared_ptr<engine::engine> eng,
                   std::shared_ptr<participant::interface> part,
                   std::shared_ptr<coordinator::coordinator> coord,
                   std::unique_ptr<rpc_server> srv,
                   size_t client_threads,
                   std::shared_ptr<logging::log> logger)
        : m_engine(std::move(eng)),
          m_participant(std::move(part)),
          m_coordinator(std::move(coord)),
          m_logger(std::move(logger)),
          m_client_pool(client_threads),
          m_srv(std::move(srv)) {
        m_srv->register_handler_callback(
            [&](request req,
                rpc_server::response_callback_type callback) -> bool {
                return enqueue(std::move(req), callback);
            });
    }

    auto server::init() -> bool {
        return m_srv->init();
    }

    auto server::enqueue(request req,
                         const rpc_server::response_callback_type& callback)
        -> bool {
        auto& pool = is_peer_request(req) ? m_peer_pool : m_client_pool;
        pool.push([this, r = std::move(req), callback]() {
            callback(handle(r));
        });
        return true;
    }

    auto server::handle(request req) -> response {
        m_logger->trace("Handling request of type", req.index());
        return std::visit(
            overloaded{
                [&](balance_request& r) -> response {
                    return account_reply<balance_response>(
                        m_engine->balance(r.m_account_no));
                },
                [&](deposit_request& r) -> response {
                    return account_reply<deposit_response>(
                        m_engine->deposit(r.m_account_no, r.m_amount));
                },
                [&](withdraw_request& r) -> response {
                    return account_reply<withdraw_response>(
                        m_engine->withdraw(r.m_account_no, r.m_amount));
                },
                [&](transfer_local_request& r) -> response {
                    auto res = m_engine->transfer_local(r.m_src_account,
                                                        r.m_dst_account,
                                                        r.m_amount);
                    if(auto* err = std::get_if<error>(&res)) {
                        return std::move(*err);
                    }
                    auto& [src, dst]
                        = std::get<std::pair<ledger::account,
                                             ledger::account>>(res);
                    return transfer_local_response{std::move(src),
                                                   std::move(dst)};
                },
                [&](prepare_request& r) -> response {
                    if(auto err = m_participant->prepare(r.m_params)) {
                        return std::move(err.value());
                    }
                    return prepare_response{true};
                },
                [&](commit_request& r) -> response {
                    if(auto err = m_participant->commit(r.m_tx_id)) {
                        return std::move(err.value());
                    }
                    return commit_response{true};
                },
                [&](abort_request& r) -> response {
                    if(auto err = m_participant->abort(r.m_tx_id)) {
                        return std::move(err.value());
                    }
                    return abort_response{true};
                },
                [&](inter_branch_transfer_request& r) -> response {
                    return inter_branch_transfer_response{
                        m_coordinator->execute(std::move(r.m_tx_id),
                                               r.m_src_account,
                                               r.m_dst_endpoint,
                                               r.m_dst_account,
                                               r.m_amount)};
                },
                [&](list_accounts_request& /* r */) -> response {
                    return list_accounts_response{m_engine->list_accounts()};
                },
                [&](create_account_request& r) -> response {
                    return account_reply<create_account_response>(
                        m_engine->create_account(r.m_account_no,
                                                 std::move(r.m_name),
                                                 r.m_balance));
                },
                [&](list_unresolved_request& /* r */) -> response {
                    return list_unresolved_response{
                        m_coordinator->list_unresolved()};
                },
                [&](resolve_unresolved_request& r) -> response {
                    auto res = m_coordinator->resolve_unresolved(r.m_tx_id);
                    if(auto* err = std::get_if<error>(&res)) {
                        return std::move(*err);
                    }
                    return resolve_unresolved_response{
                        std::get<coordinator::result>(std::move(res))};
                }},
            req);
    }
}
