// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_SERIALIZATION_UTIL_H_
#define BRANCHNET_SRC_UTIL_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"

#include <optional>

namespace branchnet {
    /// Encodes a value into a fresh buffer.
    /// \tparam T type with a serializer operator<<.
    /// \param obj value to encode.
    /// \return the encoded bytes.
    template<typename T>
    auto make_buffer(const T& obj) -> buffer {
        auto pkt = buffer();
        auto ser = buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Decodes a value that must span the whole buffer. Trailing bytes
    /// count as a decode failure.
    /// \tparam T default-constructible type with a serializer operator>>.
    /// \param buf encoded bytes.
    /// \return the value, or std::nullopt if decoding failed.
    template<typename T>
    auto from_buffer(buffer& buf) -> std::optional<T> {
        auto deser = buffer_serializer(buf);
        auto ret = T{};
        if(!(deser >> ret) || !deser.end_of_buffer()) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif // BRANCHNET_SRC_UTIL_SERIALIZATION_UTIL_H_
