// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_NETWORK_PEER_H_
#define BRANCHNET_SRC_UTIL_NETWORK_PEER_H_

#include "tcp_socket.hpp"
#include "util/common/blocking_queue.hpp"

#include <functional>
#include <memory>
#include <thread>

namespace branchnet::network {
    /// \brief One TCP connection with a background sender and receiver.
    ///
    /// Frames passed to \ref send() are queued and written by a sender
    /// thread so that callers never wait on the network. A receiver thread
    /// passes each incoming frame to the frame callback. When either
    /// direction fails the connection is shut down and the close callback
    /// runs once on the receiver thread. Connections are not re-opened.
    class peer {
      public:
        /// Receives one incoming frame.
        using frame_callback_type
            = std::function<void(std::shared_ptr<buffer>)>;
        /// Notified once the connection is down.
        using close_callback_type = std::function<void()>;

        /// Constructor. Call \ref start() to begin sending and receiving.
        /// \param sock connected socket.
        /// \param on_frame called with every incoming frame.
        /// \param on_close called once after the connection went down. May
        ///                 be empty.
        peer(std::unique_ptr<tcp_socket> sock,
             frame_callback_type on_frame,
             close_callback_type on_close);

        /// Shuts the connection down and joins both threads. Must not run
        /// on the receiver thread, so callbacks must not own the peer.
        ~peer();

        peer(const peer&) = delete;
        auto operator=(const peer&) -> peer& = delete;

        peer(peer&&) = delete;
        auto operator=(peer&&) -> peer& = delete;

        /// Starts the sender and receiver threads.
        void start();

        /// Queues a frame for sending. Frames queued after the connection
        /// went down are dropped.
        /// \param pkt frame to send.
        void send(std::shared_ptr<buffer> pkt);

        /// Shuts the connection down. Does not wait for the threads.
        void shutdown();

        /// Returns whether the connection is up.
        /// \return true if connected.
        [[nodiscard]] auto connected() const -> bool;

      private:
        std::unique_ptr<tcp_socket> m_sock;
        blocking_queue<std::shared_ptr<buffer>> m_send_queue;
        frame_callback_type m_on_frame;
        close_callback_type m_on_close;

        std::thread m_send_thread;
        std::thread m_recv_thread;

        void send_loop();
        void recv_loop();
    };
}

#endif // BRANCHNET_SRC_UTIL_NETWORK_PEER_H_
