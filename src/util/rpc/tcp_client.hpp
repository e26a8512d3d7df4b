// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_RPC_TCP_CLIENT_H_
#define BRANCHNET_SRC_UTIL_RPC_TCP_CLIENT_H_

#include "format.hpp"
#include "util/network/connection_manager.hpp"
#include "util/serialization/util.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <unordered_map>

namespace branchnet::rpc {
    /// \brief RPC client over a single TCP connection.
    ///
    /// Any number of threads may have calls in flight at once. When the
    /// connection goes down, every waiting call fails immediately and later
    /// calls fail without being sent. The client never reconnects; create a
    /// new one instead.
    /// \see branchnet::rpc::tcp_server
    /// \tparam Request type for requests.
    /// \tparam Response type for responses.
    template<typename Request, typename Response>
    class tcp_client {
      public:
        /// Constructor.
        /// \param server_endpoint endpoint of the RPC server.
        explicit tcp_client(network::endpoint_t server_endpoint)
            : m_server_endpoint(std::move(server_endpoint)) {}

        tcp_client(tcp_client&&) = delete;
        auto operator=(tcp_client&&) -> tcp_client& = delete;
        tcp_client(const tcp_client&) = delete;
        auto operator=(const tcp_client&) -> tcp_client& = delete;

        /// Disconnects and fails the calls still waiting.
        ~tcp_client() {
            m_net.close();
            fail_pending();
        }

        /// Connects to the server.
        /// \return false if the server could not be reached.
        [[nodiscard]] auto init() -> bool {
            m_server = m_net.connect(
                m_server_endpoint,
                [&](network::message_t&& msg) -> std::optional<buffer> {
                    handle_response(*msg.m_pkt);
                    return std::nullopt;
                },
                [&]() {
                    fail_pending();
                });
            return m_server.has_value();
        }

        /// Reports whether the connection is up.
        /// \return true if connected.
        [[nodiscard]] auto connected() -> bool {
            return m_server.has_value() && m_net.connected(m_server.value());
        }

        /// Sends a request and waits for its response. Thread safe.
        /// \param payload request payload.
        /// \param timeout how long to wait for the response. Zero waits
        ///                until the response arrives or the connection
        ///                goes down.
        /// \return response payload, or std::nullopt if the call timed out,
        ///         the connection was down or went down, or the server
        ///         could not process the request.
        [[nodiscard]] auto call(Request payload,
                                std::chrono::milliseconds timeout
                                = std::chrono::milliseconds::zero())
            -> std::optional<Response> {
            if(!m_server.has_value()) {
                return std::nullopt;
            }
            const auto request_id = m_next_request_id++;
            auto result = promise_type();
            auto result_future = result.get_future();
            {
                std::unique_lock<std::mutex> l(m_pending_mut);
                if(m_closed) {
                    return std::nullopt;
                }
                m_pending.emplace(request_id, std::move(result));
            }

            auto pkt = std::make_shared<buffer>(make_buffer(
                request<Request>{header{request_id}, std::move(payload)}));
            m_net.send(pkt, m_server.value());

            if(timeout != std::chrono::milliseconds::zero()
               && result_future.wait_for(timeout)
                      == std::future_status::timeout) {
                complete(request_id, std::nullopt);
            }
            return result_future.get();
        }

      private:
        using promise_type = std::promise<std::optional<Response>>;

        network::endpoint_t m_server_endpoint;
        network::connection_manager m_net;
        std::optional<network::peer_id_t> m_server;

        std::atomic<request_id_type> m_next_request_id{0};

        std::mutex m_pending_mut;
        std::unordered_map<request_id_type, promise_type> m_pending;
        bool m_closed{false};

        void handle_response(buffer& pkt) {
            auto resp = from_buffer<response<Response>>(pkt);
            if(resp.has_value()) {
                complete(resp->m_header.m_request_id,
                         std::move(resp->m_payload));
            }
        }

        void complete(request_id_type request_id,
                      std::optional<Response> value) {
            auto node = [&]() {
                std::unique_lock<std::mutex> l(m_pending_mut);
                return m_pending.extract(request_id);
            }();
            if(!node.empty()) {
                node.mapped().set_value(std::move(value));
            }
        }

        void fail_pending() {
            auto pending = decltype(m_pending)();
            {
                std::unique_lock<std::mutex> l(m_pending_mut);
                m_closed = true;
                pending.swap(m_pending);
            }
            for(auto& [request_id, result] : pending) {
                result.set_value(std::nullopt);
            }
        }
    };
}

#endif // BRANCHNET_SRC_UTIL_RPC_TCP_CLIENT_H_
