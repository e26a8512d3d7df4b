// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_NETWORK_SOCKET_H_
#define BRANCHNET_SRC_UTIL_NETWORK_SOCKET_H_

#include <atomic>
#include <functional>
#include <netdb.h>
#include <string>
#include <utility>

namespace branchnet::network {
    /// An IP address or host name.
    using ip_address = std::string;
    /// Port number.
    using port_number_t = unsigned short;
    /// [host name, port number].
    using endpoint_t = std::pair<ip_address, port_number_t>;

    /// IP address for localhost.
    static const auto localhost = ip_address("127.0.0.1");

    /// Formats an endpoint as "host:port".
    /// \param ep endpoint to format.
    /// \return formatted string.
    auto to_string(const endpoint_t& ep) -> std::string;

    /// Returns whether two endpoints name the same listener. Host names
    /// are resolved, so "localhost" matches "127.0.0.1" on the same port.
    /// \param lhs first endpoint.
    /// \param rhs second endpoint.
    /// \return true if the ports match and the hosts share an address.
    auto same_endpoint(const endpoint_t& lhs, const endpoint_t& rhs) -> bool;

    /// \brief Owner of a stream socket descriptor.
    ///
    /// \ref shutdown() unblocks every thread reading, writing or accepting
    /// on the socket. The descriptor itself is only closed by the
    /// destructor, so such a thread never ends up using a descriptor number
    /// the process has already reused.
    class socket {
      public:
        socket(const socket&) = delete;
        auto operator=(const socket&) -> socket& = delete;

        socket(socket&&) = delete;
        auto operator=(socket&&) -> socket& = delete;

        /// Closes the descriptor.
        virtual ~socket();

        /// Shuts down both directions of the socket. Safe to call from any
        /// thread, any number of times.
        void shutdown();

        /// Returns whether the socket holds a descriptor that was not shut
        /// down yet.
        /// \return true if open.
        [[nodiscard]] auto is_open() const -> bool;

      protected:
        socket() = default;

        /// Function setting up a fresh descriptor for one resolved address.
        /// Returns false to move on to the next address.
        using attempt_type = std::function<bool(int, const addrinfo&)>;

        /// Resolves the endpoint and runs the attempt on a new descriptor
        /// for each resolved address until one succeeds. The socket keeps
        /// the descriptor of the successful attempt.
        /// \param ep endpoint to resolve.
        /// \param attempt setup to run per address.
        /// \return true if an attempt succeeded.
        auto open(const endpoint_t& ep, const attempt_type& attempt) -> bool;

        /// Takes ownership of a connected descriptor.
        /// \param fd descriptor to own.
        void adopt(int fd);

        /// Returns the descriptor, or -1 if the socket was never opened.
        /// \return descriptor.
        [[nodiscard]] auto fd() const -> int;

      private:
        int m_fd{-1};
        std::atomic_bool m_open{false};
    };
}

#endif // BRANCHNET_SRC_UTIL_NETWORK_SOCKET_H_
