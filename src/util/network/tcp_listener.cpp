// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "tcp_listener.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace branchnet::network {
    auto tcp_listener::listen(const endpoint_t& ep) -> bool {
        return open(ep, [](int fd, const addrinfo& addr) {
            static constexpr int one = 1;
            if(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one))
               != 0) {
                return false;
            }
            if(bind(fd, addr.ai_addr, addr.ai_addrlen) != 0) {
                return false;
            }
            static constexpr auto backlog = 64;
            return ::listen(fd, backlog) == 0;
        });
    }

    auto tcp_listener::accept() -> std::unique_ptr<tcp_socket> {
        while(is_open()) {
            auto fd = ::accept4(this->fd(), nullptr, nullptr, SOCK_CLOEXEC);
            if(fd == -1) {
                if(errno == EINTR || errno == ECONNABORTED) {
                    continue;
                }
                return nullptr;
            }
            if(!is_open() || !tcp_socket::disable_nagle(fd)) {
                ::close(fd);
                continue;
            }
            auto sock = std::make_unique<tcp_socket>();
            sock->adopt(fd);
            return sock;
        }
        return nullptr;
    }
}
