// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "connection_manager.hpp"

#include <vector>

namespace branchnet::network {
    connection_manager::~connection_manager() {
        close();
    }

    auto connection_manager::start_server(const endpoint_t& listen_endpoint,
                                          packet_handler_t handler) -> bool {
        if(!m_listener.listen(listen_endpoint)) {
            return false;
        }
        m_accept_thread = std::thread([this, h = std::move(handler)]() {
            while(m_running) {
                auto sock = m_listener.accept();
                if(!sock) {
                    break;
                }
                prune_closed_peers();
                if(!add(std::move(sock), h, nullptr).has_value()) {
                    break;
                }
            }
        });
        return true;
    }

    auto connection_manager::connect(const endpoint_t& ep,
                                     packet_handler_t handler,
                                     peer::close_callback_type on_close)
        -> std::optional<peer_id_t> {
        auto sock = std::make_unique<tcp_socket>();
        if(!sock->connect(ep)) {
            return std::nullopt;
        }
        return add(std::move(sock), handler, std::move(on_close));
    }

    auto connection_manager::add(std::unique_ptr<tcp_socket> sock,
                                 const packet_handler_t& handler,
                                 peer::close_callback_type on_close)
        -> std::optional<peer_id_t> {
        const auto peer_id = m_next_peer_id++;
        auto on_frame = [this, peer_id, handler](std::shared_ptr<buffer> pkt) {
            auto reply = handler(message_t{std::move(pkt), peer_id});
            if(reply.has_value()) {
                send(std::make_shared<buffer>(std::move(reply.value())),
                     peer_id);
            }
        };
        auto p = std::make_shared<peer>(std::move(sock),
                                        std::move(on_frame),
                                        std::move(on_close));
        std::unique_lock<std::shared_mutex> l(m_peers_mut);
        if(!m_running) {
            return std::nullopt;
        }
        // Started once registered so that the first reply finds the peer
        p->start();
        m_peers.emplace(peer_id, std::move(p));
        return peer_id;
    }

    void connection_manager::send(const std::shared_ptr<buffer>& data,
                                  peer_id_t peer_id) {
        // Only the map owns peers, so a peer is never destroyed by a
        // sender that happens to run on its receiver thread.
        std::shared_lock<std::shared_mutex> l(m_peers_mut);
        auto it = m_peers.find(peer_id);
        if(it != m_peers.end()) {
            it->second->send(data);
        }
    }

    auto connection_manager::connected(peer_id_t peer_id) -> bool {
        std::shared_lock<std::shared_mutex> l(m_peers_mut);
        auto it = m_peers.find(peer_id);
        return it != m_peers.end() && it->second->connected();
    }

    void connection_manager::close() {
        m_running = false;
        m_listener.shutdown();
        if(m_accept_thread.joinable()) {
            m_accept_thread.join();
        }

        auto peers = decltype(m_peers)();
        {
            std::unique_lock<std::shared_mutex> l(m_peers_mut);
            peers.swap(m_peers);
        }
        for(auto& [peer_id, p] : peers) {
            p->shutdown();
        }
        // Joins the peers' threads outside the lock
        peers.clear();
    }

    void connection_manager::prune_closed_peers() {
        auto closed = std::vector<std::shared_ptr<peer>>();
        {
            std::unique_lock<std::shared_mutex> l(m_peers_mut);
            for(auto it = m_peers.begin(); it != m_peers.end();) {
                if(it->second->connected()) {
                    it++;
                    continue;
                }
                closed.push_back(std::move(it->second));
                it = m_peers.erase(it);
            }
        }
        closed.clear();
    }
}
