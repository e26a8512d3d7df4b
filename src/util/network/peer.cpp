// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "peer.hpp"

namespace branchnet::network {
    peer::peer(std::unique_ptr<tcp_socket> sock,
               frame_callback_type on_frame,
               close_callback_type on_close)
        : m_sock(std::move(sock)),
          m_on_frame(std::move(on_frame)),
          m_on_close(std::move(on_close)) {}

    peer::~peer() {
        shutdown();
        if(m_send_thread.joinable()) {
            m_send_thread.join();
        }
        if(m_recv_thread.joinable()) {
            m_recv_thread.join();
        }
    }

    void peer::start() {
        m_send_thread = std::thread([&]() {
            send_loop();
        });
        m_recv_thread = std::thread([&]() {
            recv_loop();
        });
    }

    void peer::send(std::shared_ptr<buffer> pkt) {
        if(connected()) {
            m_send_queue.push(std::move(pkt));
        }
    }

    void peer::shutdown() {
        m_sock->shutdown();
        m_send_queue.clear();
    }

    auto peer::connected() const -> bool {
        return m_sock->is_open();
    }

    void peer::send_loop() {
        auto pkt = std::shared_ptr<buffer>();
        while(m_send_queue.pop(pkt)) {
            if(!m_sock->send(*pkt)) {
                // Wakes the receiver, which reports the closed connection
                m_sock->shutdown();
                break;
            }
        }
    }

    void peer::recv_loop() {
        while(true) {
            auto pkt = std::make_shared<buffer>();
            if(!m_sock->receive(*pkt)) {
                break;
            }
            m_on_frame(std::move(pkt));
        }
        shutdown();
        if(m_on_close) {
            m_on_close();
        }
    }
}
