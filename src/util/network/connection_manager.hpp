// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_NETWORK_CONNECTION_MANAGER_H_
#define BRANCHNET_SRC_UTIL_NETWORK_CONNECTION_MANAGER_H_

#include "peer.hpp"
#include "tcp_listener.hpp"

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <thread>

namespace branchnet::network {
    /// Peer IDs within a \ref connection_manager.
    using peer_id_t = size_t;

    /// Frame received from a peer.
    struct message_t {
        /// Frame data.
        std::shared_ptr<buffer> m_pkt;
        /// Peer that sent the frame.
        peer_id_t m_peer_id{};
    };

    /// \brief Function type for frame handler callbacks.
    ///
    /// Receives a frame to handle. Optionally returns a frame to send back
    /// to the peer that sent the original frame, or std::nullopt to send
    /// nothing back.
    using packet_handler_t = std::function<std::optional<buffer>(message_t&&)>;

    /// \brief Owns the connections of one side of an RPC channel.
    ///
    /// Either listens and serves every accepted connection, or holds
    /// outbound connections. Incoming frames are passed to the handler on
    /// the receiver thread of the connection they arrived on. Connections
    /// that went down are forgotten the next time a connection is
    /// accepted.
    class connection_manager {
      public:
        connection_manager() = default;

        connection_manager(const connection_manager&) = delete;
        auto operator=(const connection_manager&)
            -> connection_manager& = delete;

        connection_manager(connection_manager&&) = delete;
        auto operator=(connection_manager&&) -> connection_manager& = delete;

        /// Calls \ref close().
        ~connection_manager();

        /// Starts listening on the given endpoint and accepting connections
        /// on a background thread.
        /// \param listen_endpoint endpoint to listen on.
        /// \param handler handles frames from accepted connections.
        /// \return false if the endpoint could not be bound.
        [[nodiscard]] auto start_server(const endpoint_t& listen_endpoint,
                                        packet_handler_t handler) -> bool;

        /// Opens an outbound connection.
        /// \param ep endpoint to connect to.
        /// \param handler handles frames received on the connection.
        /// \param on_close called once if the connection goes down.
        /// \return ID of the new peer, or std::nullopt if the endpoint
        ///         could not be reached.
        [[nodiscard]] auto connect(const endpoint_t& ep,
                                   packet_handler_t handler,
                                   peer::close_callback_type on_close)
            -> std::optional<peer_id_t>;

        /// Queues a frame for the given peer. Does nothing if the peer is
        /// gone.
        /// \param data frame to send.
        /// \param peer_id recipient.
        void send(const std::shared_ptr<buffer>& data, peer_id_t peer_id);

        /// Returns whether the connection to the given peer is up.
        /// \param peer_id peer to check.
        /// \return true if connected.
        [[nodiscard]] auto connected(peer_id_t peer_id) -> bool;

        /// Stops the listener and shuts down every connection. Waits for
        /// handlers still running. Safe to call more than once.
        void close();

      private:
        tcp_listener m_listener;
        std::thread m_accept_thread;

        std::shared_mutex m_peers_mut;
        std::map<peer_id_t, std::shared_ptr<peer>> m_peers;
        std::atomic<peer_id_t> m_next_peer_id{0};

        std::atomic_bool m_running{true};

        auto add(std::unique_ptr<tcp_socket> sock,
                 const packet_handler_t& handler,
                 peer::close_callback_type on_close)
            -> std::optional<peer_id_t>;

        void prune_closed_peers();
    };
}

#endif // BRANCHNET_SRC_UTIL_NETWORK_CONNECTION_MANAGER_H_
