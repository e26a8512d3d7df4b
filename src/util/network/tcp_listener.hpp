// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_NETWORK_TCP_LISTENER_H_
#define BRANCHNET_SRC_UTIL_NETWORK_TCP_LISTENER_H_

#include "tcp_socket.hpp"

#include <memory>

namespace branchnet::network {
    /// Accepts incoming TCP connections on a local endpoint. Calling
    /// \ref shutdown() from another thread unblocks a pending
    /// \ref accept().
    class tcp_listener : public socket {
      public:
        tcp_listener() = default;
        ~tcp_listener() override = default;

        tcp_listener(const tcp_listener&) = delete;
        auto operator=(const tcp_listener&) -> tcp_listener& = delete;

        tcp_listener(tcp_listener&&) = delete;
        auto operator=(tcp_listener&&) -> tcp_listener& = delete;

        /// Binds the endpoint and starts listening.
        /// \param ep address and port to listen on.
        /// \return false if the endpoint could not be bound.
        auto listen(const endpoint_t& ep) -> bool;

        /// Blocks until a client connects.
        /// \return socket connected to the client, or nullptr once the
        ///         listener was shut down or failed.
        auto accept() -> std::unique_ptr<tcp_socket>;
    };
}

#endif // BRANCHNET_SRC_UTIL_NETWORK_TCP_LISTENER_H_
