// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "tcp_socket.hpp"

#include <array>
#include <cerrno>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <vector>

namespace branchnet::network {
    auto tcp_socket::connect(const endpoint_t& ep) -> bool {
        return open(ep, [](int fd, const addrinfo& addr) {
            if(::connect(fd, addr.ai_addr, addr.ai_addrlen) != 0) {
                return false;
            }
            return disable_nagle(fd);
        });
    }

    auto tcp_socket::send(const buffer& pkt) const -> bool {
        const auto len = static_cast<uint64_t>(pkt.size());
        auto prefix = std::array<unsigned char, sizeof(len)>{};
        for(size_t i{0}; i < prefix.size(); i++) {
            prefix[i] = static_cast<unsigned char>(
                len >> (8 * (prefix.size() - 1 - i)));
        }
        return write_all(prefix.data(), prefix.size())
            && write_all(pkt.data(), pkt.size());
    }

    auto tcp_socket::receive(buffer& pkt) const -> bool {
        auto prefix = std::array<unsigned char, sizeof(uint64_t)>{};
        if(!read_all(prefix.data(), prefix.size())) {
            return false;
        }
        uint64_t len{0};
        for(const auto b : prefix) {
            len = (len << 8) | b;
        }
        if(len > max_frame_size) {
            return false;
        }

        auto data = std::vector<std::byte>(len);
        if(!read_all(data.data(), data.size())) {
            return false;
        }
        pkt.clear();
        pkt.append(data.data(), data.size());
        return true;
    }

    auto tcp_socket::write_all(const void* data, size_t len) const -> bool {
        const auto* pos = static_cast<const std::byte*>(data);
        size_t written{0};
        while(written < len) {
            // MSG_NOSIGNAL: a vanished peer is an error return, not SIGPIPE
            auto n = ::send(fd(), pos + written, len - written, MSG_NOSIGNAL);
            if(n < 0 && errno == EINTR) {
                continue;
            }
            if(n <= 0) {
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    auto tcp_socket::read_all(void* data, size_t len) const -> bool {
        auto* pos = static_cast<std::byte*>(data);
        size_t read{0};
        while(read < len) {
            auto n = ::recv(fd(), pos + read, len - read, 0);
            if(n < 0 && errno == EINTR) {
                continue;
            }
            if(n <= 0) {
                return false;
            }
            read += static_cast<size_t>(n);
        }
        return true;
    }

    auto tcp_socket::disable_nagle(int fd) -> bool {
        static constexpr int one = 1;
        return setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one))
            == 0;
    }
}
