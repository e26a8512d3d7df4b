// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_RPC_MESSAGES_H_
#define BRANCHNET_SRC_UTIL_RPC_MESSAGES_H_

#include <cstdint>
#include <optional>

namespace branchnet::rpc {
    /// Identifier matching a response to the call that is waiting for it.
    using request_id_type = uint64_t;

    /// Header shared by requests and responses. The client picks a fresh
    /// identifier per call and the server echoes it back.
    struct header {
        request_id_type m_request_id{};
    };

    /// Request frame.
    /// \tparam T request payload type.
    template<typename T>
    struct request {
        header m_header;
        T m_payload;
    };

    /// Response frame.
    /// \tparam T response payload type.
    template<typename T>
    struct response {
        header m_header;
        /// Response payload, or std::nullopt if the server could not decode
        /// or would not take the request.
        std::optional<T> m_payload;
    };
}

#endif // BRANCHNET_SRC_UTIL_RPC_MESSAGES_H_
