// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_SERIALIZATION_SERIALIZER_H_
#define BRANCHNET_SRC_UTIL_SERIALIZATION_SERIALIZER_H_

#include <cstddef>

namespace branchnet {
    /// Byte sink and source for the wire and storage codecs. Writes go to
    /// the end of the underlying storage. Reads consume it from the front.
    /// A serializer stays failed once an operation on it has failed.
    class serializer {
      public:
        virtual ~serializer() = default;

        serializer(const serializer&) = delete;
        auto operator=(const serializer&) = delete;

        serializer(serializer&&) = delete;
        auto operator=(serializer&&) = delete;

        /// \return false if any operation so far has failed.
        virtual explicit operator bool() const = 0;

        /// \return true if every byte has been read.
        [[nodiscard]] virtual auto end_of_buffer() const -> bool = 0;

        /// \return number of bytes not yet read.
        [[nodiscard]] virtual auto remaining() const -> size_t = 0;

        /// Appends raw bytes.
        /// \param data start of the bytes to write.
        /// \param len number of bytes to write.
        /// \return true if all bytes were written.
        virtual auto write(const void* data, size_t len) -> bool = 0;

        /// Reads raw bytes. Fails without consuming anything if fewer than
        /// len bytes remain.
        /// \param data destination of the bytes.
        /// \param len number of bytes to read.
        /// \return true if all bytes were read.
        virtual auto read(void* data, size_t len) -> bool = 0;

        /// Marks the serializer failed. Codecs call this when the bytes
        /// were readable but do not form a valid value.
        virtual void invalidate() = 0;

      protected:
        serializer() = default;
    };
}

#endif // BRANCHNET_SRC_UTIL_SERIALIZATION_SERIALIZER_H_
