// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_RPC_TCP_SERVER_H_
#define BRANCHNET_SRC_UTIL_RPC_TCP_SERVER_H_

#include "format.hpp"
#include "util/network/connection_manager.hpp"
#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/util.hpp"

#include <functional>

namespace branchnet::rpc {
    /// \brief RPC server over TCP.
    ///
    /// Decodes each request frame and passes the payload to the handler
    /// along with a function that sends the response back on the connection
    /// the request arrived on. The handler may respond from any thread,
    /// after it returned. A frame that does not decode is answered with an
    /// empty response if its header is readable, and dropped otherwise.
    /// \see branchnet::rpc::tcp_client
    /// \tparam Request type for requests.
    /// \tparam Response type for responses.
    template<typename Request, typename Response>
    class tcp_server {
      public:
        /// Sends the response to a request. Called once per request.
        /// std::nullopt sends an empty response.
        using response_callback_type
            = std::function<void(std::optional<Response>)>;

        /// Handler callback function type. Returns false to reject the
        /// request, which is then answered with an empty response and the
        /// response callback must not be called.
        using callback_type
            = std::function<bool(Request, response_callback_type)>;

        /// Constructor.
        /// \param listen_endpoint endpoint on which to listen for incoming
        ///                        connections.
        explicit tcp_server(network::endpoint_t listen_endpoint)
            : m_net(std::make_shared<network::connection_manager>()),
              m_listen_endpoint(std::move(listen_endpoint)) {}

        tcp_server(tcp_server&&) = delete;
        auto operator=(tcp_server&&) -> tcp_server& = delete;
        tcp_server(const tcp_server&) = delete;
        auto operator=(const tcp_server&) -> tcp_server& = delete;

        /// Calls \ref close().
        ~tcp_server() {
            close();
        }

        /// Registers the request handler. Call before \ref init().
        /// \param callback handler.
        void register_handler_callback(callback_type callback) {
            m_callback = std::move(callback);
        }

        /// Registers a handler that computes each response on the thread
        /// that received the request. Call before \ref init().
        /// \param handler returns the response, or std::nullopt to send an
        ///                empty response.
        void register_blocking_handler(
            std::function<std::optional<Response>(Request)> handler) {
            register_handler_callback(
                [h = std::move(handler)](Request req,
                                         response_callback_type respond) {
                    respond(h(std::move(req)));
                    return true;
                });
        }

        /// Starts listening.
        /// \return false if the endpoint could not be bound.
        [[nodiscard]] auto init() -> bool {
            return m_net->start_server(
                m_listen_endpoint,
                [&](network::message_t&& msg) -> std::optional<buffer> {
                    return handle(std::move(msg));
                });
        }

        /// Stops listening and disconnects all clients. Responses sent
        /// afterwards are dropped. Safe to call more than once.
        void close() {
            m_net->close();
        }

      private:
        // Shared with pending response callbacks, which may outlive the
        // server.
        std::shared_ptr<network::connection_manager> m_net;
        network::endpoint_t m_listen_endpoint;
        callback_type m_callback;

        auto handle(network::message_t&& msg) -> std::optional<buffer> {
            auto req = from_buffer<request<Request>>(*msg.m_pkt);
            if(!req.has_value()) {
                auto deser = buffer_serializer(*msg.m_pkt);
                auto hdr = header();
                if(!(deser >> hdr)) {
                    return std::nullopt;
                }
                return empty_response(hdr);
            }

            const auto hdr = req->m_header;
            auto respond = [hdr, net = m_net, peer_id = msg.m_peer_id](
                               std::optional<Response> resp) {
                net->send(std::make_shared<buffer>(make_buffer(
                              response<Response>{hdr, std::move(resp)})),
                          peer_id);
            };
            if(!m_callback
               || !m_callback(std::move(req->m_payload), std::move(respond))) {
                return empty_response(hdr);
            }
            return std::nullopt;
        }

        static auto empty_response(const header& hdr) -> buffer {
            return make_buffer(response<Response>{hdr, std::nullopt});
        }
    };
}

#endif // BRANCHNET_SRC_UTIL_RPC_TCP_SERVER_H_
