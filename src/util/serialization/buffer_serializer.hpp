// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_SERIALIZATION_BUFFER_SERIALIZER_H_
#define BRANCHNET_SRC_UTIL_SERIALIZATION_BUFFER_SERIALIZER_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

namespace branchnet {
    /// \ref serializer over a \ref buffer. Writing grows the buffer and
    /// reading advances a cursor from its start.
    class buffer_serializer final : public serializer {
      public:
        /// \param pkt buffer to append to or read from. Must outlive the
        ///            serializer.
        explicit buffer_serializer(buffer& pkt);

        explicit operator bool() const final;

        [[nodiscard]] auto end_of_buffer() const -> bool final;
        [[nodiscard]] auto remaining() const -> size_t final;

        auto write(const void* data, size_t len) -> bool final;
        auto read(void* data, size_t len) -> bool final;

        void invalidate() final;

      private:
        buffer& m_pkt;
        size_t m_cursor{0};
        bool m_valid{true};
    };
}

#endif // BRANCHNET_SRC_UTIL_SERIALIZATION_BUFFER_SERIALIZER_H_
