// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "socket.hpp"

#include <cstring>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

namespace branchnet::network {
    auto to_string(const endpoint_t& ep) -> std::string {
        return ep.first + ":" + std::to_string(ep.second);
    }

    namespace {
        using addrinfo_ptr = std::unique_ptr<addrinfo, void (*)(addrinfo*)>;

        auto resolve(const endpoint_t& ep) -> addrinfo_ptr {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo* res0{};
            const auto port = std::to_string(ep.second);
            if(getaddrinfo(ep.first.c_str(), port.c_str(), &hints, &res0)
               != 0) {
                return addrinfo_ptr(nullptr, &freeaddrinfo);
            }
            return addrinfo_ptr(res0, &freeaddrinfo);
        }
    }

    auto same_endpoint(const endpoint_t& lhs, const endpoint_t& rhs)
        -> bool {
        if(lhs.second != rhs.second) {
            return false;
        }
        if(lhs.first == rhs.first) {
            return true;
        }
        auto lhs_addrs = resolve(lhs);
        auto rhs_addrs = resolve(rhs);
        for(auto* l = lhs_addrs.get(); l != nullptr; l = l->ai_next) {
            for(auto* r = rhs_addrs.get(); r != nullptr; r = r->ai_next) {
                if(l->ai_family == r->ai_family
                   && l->ai_addrlen == r->ai_addrlen
                   && std::memcmp(l->ai_addr, r->ai_addr, l->ai_addrlen)
                          == 0) {
                    return true;
                }
            }
        }
        return false;
    }

    socket::~socket() {
        if(m_fd != -1) {
            ::shutdown(m_fd, SHUT_RDWR);
            ::close(m_fd);
        }
    }

    void socket::shutdown() {
        if(m_open.exchange(false)) {
            ::shutdown(m_fd, SHUT_RDWR);
        }
    }

    auto socket::is_open() const -> bool {
        return m_open;
    }

    auto socket::open(const endpoint_t& ep, const attempt_type& attempt)
        -> bool {
        auto addrs = resolve(ep);
        for(auto* res = addrs.get(); res != nullptr; res = res->ai_next) {
            auto fd = ::socket(res->ai_family,
                               res->ai_socktype | SOCK_CLOEXEC,
                               res->ai_protocol);
            if(fd == -1) {
                continue;
            }
            if(!attempt(fd, *res)) {
                ::close(fd);
                continue;
            }
            adopt(fd);
            return true;
        }
        return false;
    }

    void socket::adopt(int fd) {
        m_fd = fd;
        m_open = true;
    }

    auto socket::fd() const -> int {
        return m_fd;
    }
}
