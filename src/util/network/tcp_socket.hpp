// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_NETWORK_TCP_SOCKET_H_
#define BRANCHNET_SRC_UTIL_NETWORK_TCP_SOCKET_H_

#include "socket.hpp"
#include "util/common/buffer.hpp"

#include <cstdint>

namespace branchnet::network {
    /// Largest frame accepted from a peer. A larger length prefix is
    /// treated as a broken connection.
    static constexpr uint64_t max_frame_size = 64ULL * 1024 * 1024;

    /// \brief Connected TCP stream carrying discrete frames.
    ///
    /// A frame is its length as an 8-byte big-endian integer followed by
    /// that many bytes of data.
    class tcp_socket : public socket {
      public:
        tcp_socket() = default;
        ~tcp_socket() override = default;

        tcp_socket(const tcp_socket&) = delete;
        auto operator=(const tcp_socket&) -> tcp_socket& = delete;

        tcp_socket(tcp_socket&&) = delete;
        auto operator=(tcp_socket&&) -> tcp_socket& = delete;

        /// Connects to the given endpoint.
        /// \param ep endpoint to connect to.
        /// \return true if the connection was established.
        auto connect(const endpoint_t& ep) -> bool;

        /// Writes one frame. Must not be called by two threads at once.
        /// \param pkt frame data.
        /// \return true if the whole frame was written.
        [[nodiscard]] auto send(const buffer& pkt) const -> bool;

        /// Blocks until one complete frame arrived.
        /// \param pkt buffer replaced with the frame data.
        /// \return false if the connection closed or broke first.
        [[nodiscard]] auto receive(buffer& pkt) const -> bool;

      private:
        friend class tcp_listener;

        auto write_all(const void* data, size_t len) const -> bool;
        auto read_all(void* data, size_t len) const -> bool;

        /// Frames are small request and response pairs, so waiting to
        /// coalesce them only adds latency.
        static auto disable_nagle(int fd) -> bool;
    };
}

#endif // BRANCHNET_SRC_UTIL_NETWORK_TCP_SOCKET_H_
