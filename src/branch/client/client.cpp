// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

namespace branchnet::branch {
    client::client(network::endpoint_t endpoint,
                   std::chrono::milliseconds default_timeout,
                   std::shared_ptr<logging::log> logger)
        : m_endpoint(std::move(endpoint)),
          m_default_timeout(default_timeout),
          m_logger(std::move(logger)) {}

    auto client::init() -> bool {
        return connect() != nullptr;
    }

    auto client::balance(ledger::account_no_t account_no) -> account_result {
        auto res = send_expecting<balance_response>(
            balance_request{account_no},
            m_default_timeout);
        if(auto* resp = std::get_if<balance_response>(&res)) {
            return std::move(resp->m_account);
        }
        return std::get<error>(res);
    }

    auto client::deposit(ledger::account_no_t account_no,
                         ledger::amount_t amount) -> account_result {
        auto res = send_expecting<deposit_response>(
            deposit_request{account_no, amount},
            m_default_timeout);
        if(auto* resp = std::get_if<deposit_response>(&res)) {
            return std::move(resp->m_account);
        }
        return std::get<error>(res);
    }

    auto client::withdraw(ledger::account_no_t account_no,
                          ledger::amount_t amount) -> account_result {
        auto res = send_expecting<withdraw_response>(
            withdraw_request{account_no, amount},
            m_default_timeout);
        if(auto* resp = std::get_if<withdraw_response>(&res)) {
            return std::move(resp->m_account);
        }
        return std::get<error>(res);
    }

    auto client::transfer_local(ledger::account_no_t src_account,
                                ledger::account_no_t dst_account,
                                ledger::amount_t amount)
        -> std::variant<transfer_local_response, error> {
        return send_expecting<transfer_local_response>(
            transfer_local_request{src_account, dst_account, amount},
            m_default_timeout);
    }

    auto client::inter_branch_transfer(inter_branch_transfer_request req)
        -> std::variant<coordinator::result, error> {
        auto res = send_expecting<inter_branch_transfer_response>(
            std::move(req),
            m_default_timeout);
        if(auto* resp = std::get_if<inter_branch_transfer_response>(&res)) {
            return std::move(resp->m_result);
        }
        return std::get<error>(res);
    }

    auto client::list_accounts()
        -> std::variant<std::vector<ledger::account>, error> {
        auto res = send_expecting<list_accounts_response>(
            list_accounts_request{},
            m_default_timeout);
        if(auto* resp = std::get_if<list_accounts_response>(&res)) {
            return std::move(resp->m_accounts);
        }
        return std::get<error>(res);
    }

    auto client::create_account(ledger::account_no_t account_no,
                                std::string name,
                                ledger::amount_t balance) -> account_result {
        auto res = send_expecting<create_account_response>(
            create_account_request{account_no, std::move(name), balance},
            m_default_timeout);
        if(auto* resp = std::get_if<create_account_response>(&res)) {
            return std::move(resp->m_account);
        }
        return std::get<error>(res);
    }

    auto client::list_unresolved()
        -> std::variant<std::vector<coordinator::record>, error> {
        auto res = send_expecting<list_unresolved_response>(
            list_unresolved_request{},
            m_default_timeout);
        if(auto* resp = std::get_if<list_unresolved_response>(&res)) {
            return std::move(resp->m_records);
        }
        return std::get<error>(res);
    }

    auto client::resolve_unresolved(const ledger::tx_id_t& tx_id)
        -> std::variant<coordinator::result, error> {
        auto res = send_expecting<resolve_unresolved_response>(
            resolve_unresolved_request{tx_id},
            m_default_timeout);
        if(auto* resp = std::get_if<resolve_unresolved_response>(&res)) {
            return std::move(resp->m_result);
        }
        return std::get<error>(res);
    }

    auto client::prepare(const participant::prepare_params& params,
                         std::chrono::milliseconds timeout)
        -> std::optional<error> {
        auto res = send_expecting<prepare_response>(prepare_request{params},
                                                    timeout);
        if(auto* err = std::get_if<error>(&res)) {
            return std::move(*err);
        }
        if(!std::get<prepare_response>(res).m_prepared) {
            return error{error_code::protocol_violation,
                         "Branch declined to prepare " + params.m_tx_id};
        }
        return std::nullopt;
    }

    auto client::commit(const ledger::tx_id_t& tx_id,
                        std::chrono::milliseconds timeout)
        -> std::optional<error> {
        auto res = send_expecting<commit_response>(commit_request{tx_id},
                                                   timeout);
        if(auto* err = std::get_if<error>(&res)) {
            return std::move(*err);
        }
        if(!std::get<commit_response>(res).m_committed) {
            return error{error_code::protocol_violation,
                         "Branch declined to commit " + tx_id};
        }
        return std::nullopt;
    }

    auto client::abort(const ledger::tx_id_t& tx_id,
                       std::chrono::milliseconds timeout)
        -> std::optional<error> {
        auto res
            = send_expecting<abort_response>(abort_request{tx_id}, timeout);
        if(auto* err = std::get_if<error>(&res)) {
            return std::move(*err);
        }
        if(!std::get<abort_response>(res).m_aborted) {
            return error{error_code::protocol_violation,
                         "Branch declined to abort " + tx_id};
        }
        return std::nullopt;
    }

    auto client::endpoint() const -> const network::endpoint_t& {
        return m_endpoint;
    }

    auto client::connect() -> std::shared_ptr<rpc_client> {
        std::unique_lock<std::mutex> l(m_client_mut);
        if(m_client) {
            return m_client;
        }
        auto cli = std::make_shared<rpc_client>(m_endpoint);
        if(!cli->init()) {
            m_logger->warn("Failed to connect to branch at",
                           network::to_string(m_endpoint));
            return nullptr;
        }
        m_client = cli;
        return cli;
    }

    auto client::send(request req, std::chrono::milliseconds timeout)
        -> response {
        auto cli = connect();
        if(!cli) {
            return error{error_code::peer_unreachable,
                         "Cannot connect to "
                             + network::to_string(m_endpoint)};
        }
        auto resp = cli->call(std::move(req), timeout);
        if(resp.has_value()) {
            return std::move(resp.value());
        }
        if(!cli->connected()) {
            {
                std::unique_lock<std::mutex> l(m_client_mut);
                if(m_client == cli) {
                    m_client.reset();
                }
            }
            return error{error_code::peer_unreachable,
                         "Lost connection to "
                             + network::to_string(m_endpoint)};
        }
        return error{error_code::timeout,
                     "No response from " + network::to_string(m_endpoint)
                         + " within " + std::to_string(timeout.count())
                         + "ms"};
    }
}
