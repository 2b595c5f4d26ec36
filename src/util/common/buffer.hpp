// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_COMMON_BUFFER_H_
#define CODEPROOF_SRC_COMMON_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeproof {
    /// Buffer to store and retrieve byte data. Used for all bytecode and
    /// calldata handled by the verifier.
    class buffer {
      public:
        buffer() = default;

        /// Constructs a buffer holding a copy of the given bytes.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to copy.
        buffer(const void* data, size_t len);

        /// Returns the number of bytes contained in the buffer.
        /// \return the number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns true if the buffer holds no bytes.
        [[nodiscard]] auto empty() const -> bool;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() const -> const void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \param offset the byte offset into the buffer.
        /// \return a pointer to the data.
        [[nodiscard]] auto data_at(size_t offset) -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \param offset the byte offset into the buffer.
        /// \return a pointer to the data.
        [[nodiscard]] auto data_at(size_t offset) const -> const void*;

        /// Returns the byte at the given offset.
        /// \param offset byte offset, must be less than size().
        /// \return byte value.
        [[nodiscard]] auto byte_at(size_t offset) const -> uint8_t;

        /// Adds the given number of bytes from the given pointer to the end of
        /// the buffer.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to read.
        void append(const void* data, size_t len);

        /// Removes any existing content in the buffer making its size 0.
        void clear();

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;

        /// Extends the size of the buffer by the given length. New bytes are
        /// zero.
        /// \param len the number of bytes to add.
        void extend(size_t len);

        /// Shrinks the buffer to the given size. No-op if the buffer is
        /// already shorter.
        /// \param len new size in bytes.
        void truncate(size_t len);

        /// Returns a copy of a sub-range of the buffer. The range is clamped
        /// to the end of the buffer.
        /// \param offset first byte of the range.
        /// \param len number of bytes in the range.
        /// \return new buffer holding the range.
        [[nodiscard]] auto slice(size_t offset, size_t len) const -> buffer;

        /// Returns a copy of everything from offset to the end.
        /// \param offset first byte to copy.
        /// \return new buffer, empty if offset is past the end.
        [[nodiscard]] auto slice_from(size_t offset) const -> buffer;

        /// Overwrites a range with zero bytes. Caller must ensure the range
        /// is within the buffer.
        /// \param offset first byte to zero.
        /// \param len number of bytes to zero.
        void zero(size_t offset, size_t len);

        /// Returns a pointer to the data, cast to an unsigned char*.
        /// \return unsigned char pointer.
        [[nodiscard]] auto c_ptr() const -> const unsigned char*;

        /// Returns a pointer to the data, cast to a char*.
        /// \return char pointer.
        [[nodiscard]] auto c_str() const -> const char*;

        /// Creates a new buffer from the provided hex string. An empty string
        /// yields an empty buffer.
        /// \param hex string-encoded hex representation of this buffer.
        /// \return a new buffer, or std::nullopt if the string is not valid
        ///         hex or exceeds the maximum supported length.
        static auto from_hex(const std::string& hex) -> std::optional<buffer>;

        /// Returns a hex string representation of the contents of the buffer.
        /// \return a lower-case hex encoded string.
        [[nodiscard]] auto to_hex() const -> std::string;

        /// Creates a new buffer from the provided hex string optionally
        /// prefixed with a prefix sequence.
        /// \param hex string-encoded hex representation of this buffer.
        /// \param prefix text at start of hex string. Defaults to "0x".
        /// \return a new buffer.
        static auto from_hex_prefixed(const std::string& hex,
                                      const std::string& prefix = "0x")
            -> std::optional<buffer>;

        /// Returns a hex string representation of the contents of the
        /// buffer prefixed with a prefix sequence.
        /// \return a hex encoded string.
        [[nodiscard]] auto to_hex_prefixed(const std::string& prefix
                                           = "0x") const -> std::string;

      private:
        std::vector<std::byte> m_data{};
    };
}

#endif // CODEPROOF_SRC_COMMON_BUFFER_H_
