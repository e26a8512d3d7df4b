// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <cstring>

namespace branchnet {
    buffer::buffer(const void* data, size_t len) {
        append(data, len);
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::empty() const -> bool {
        return m_data.empty();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    void buffer::append(const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        const auto offset = m_data.size();
        m_data.resize(offset + len);
        std::memcpy(&m_data[offset], data, len);
    }

    void buffer::clear() {
        m_data.clear();
    }

    auto buffer::view() const -> std::string_view {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    auto buffer::to_hex() const -> std::string {
        static constexpr auto digits = "0123456789abcdef";
        auto ret = std::string();
        ret.reserve(m_data.size() * 2);
        for(const auto b : m_data) {
            const auto val = std::to_integer<unsigned int>(b);
            ret.push_back(digits[val / 16]);
            ret.push_back(digits[val % 16]);
        }
        return ret;
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }
}
