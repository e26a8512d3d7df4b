// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer_serializer.hpp"

#include <cstring>

namespace branchnet {
    buffer_serializer::buffer_serializer(buffer& pkt) : m_pkt(pkt) {}

    buffer_serializer::operator bool() const {
        return m_valid;
    }

    auto buffer_serializer::end_of_buffer() const -> bool {
        return m_cursor >= m_pkt.size();
    }

    auto buffer_serializer::remaining() const -> size_t {
        return end_of_buffer() ? 0 : m_pkt.size() - m_cursor;
    }

    auto buffer_serializer::write(const void* data, size_t len) -> bool {
        if(!m_valid) {
            return false;
        }
        m_pkt.append(data, len);
        return true;
    }

    auto buffer_serializer::read(void* data, size_t len) -> bool {
        if(!m_valid) {
            return false;
        }
        if(len > remaining()) {
            m_valid = false;
            return false;
        }
        if(len != 0) {
            const auto* src = static_cast<const std::byte*>(m_pkt.data());
            std::memcpy(data, src + m_cursor, len);
            m_cursor += len;
        }
        return true;
    }

    void buffer_serializer::invalidate() {
        m_valid = false;
    }
}
