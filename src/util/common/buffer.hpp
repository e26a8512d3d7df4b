// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_COMMON_BUFFER_H_
#define BRANCHNET_SRC_UTIL_COMMON_BUFFER_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace branchnet {
    /// Owned byte string. Holds serialized messages, network frames and the
    /// values written to the ledger database.
    class buffer {
      public:
        buffer() = default;

        /// Constructs a buffer holding a copy of the given bytes.
        /// \param data start of the bytes to copy.
        /// \param len number of bytes to copy.
        buffer(const void* data, size_t len);

        [[nodiscard]] auto size() const -> size_t;
        [[nodiscard]] auto empty() const -> bool;

        [[nodiscard]] auto data() -> void*;
        [[nodiscard]] auto data() const -> const void*;

        /// Copies bytes onto the end of the buffer.
        /// \param data start of the bytes to copy.
        /// \param len number of bytes to copy.
        void append(const void* data, size_t len);

        void clear();

        /// Views the contents as characters, for storage APIs that take
        /// string slices.
        /// \return view over the buffer contents. Invalidated by any
        ///         modification of the buffer.
        [[nodiscard]] auto view() const -> std::string_view;

        /// Lower-case hex encoding of the contents.
        /// \return two characters per byte.
        [[nodiscard]] auto to_hex() const -> std::string;

        auto operator==(const buffer& other) const -> bool;

      private:
        std::vector<std::byte> m_data;
    };
}

#endif // BRANCHNET_SRC_UTIL_COMMON_BUFFER_H_
