/**
 * @file chunk_type.hh
 * @brief Four-letter chunk type code with case-encoded property bits
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <string>
#include <string_view>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk_type
     * @brief Validated 4-byte chunk type
     *
     * Every byte is an ASCII letter. Bit 5 of each byte (the letter case)
     * carries one property:
     * - byte 0: uppercase = critical, lowercase = ancillary
     * - byte 1: uppercase = public, lowercase = private
     * - byte 2: uppercase = reserved bit valid
     * - byte 3: lowercase = safe to copy
     *
     * Instances are immutable once constructed.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;

        /**
         * @brief Construct from 4 raw bytes
         * @throws invalid_type_error if any byte is not an ASCII letter
         */
        explicit chunk_type(const std::array<std::uint8_t, size>& code);

        /**
         * @brief Construct from 4 bytes at @p data
         * @throws invalid_type_error if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Construct from text such as "IHDR"
         *
         * All characters are checked for being letters before the length is
         * checked, so "ab1" reports a non-alphabetic character rather than
         * a wrong length.
         *
         * @throws invalid_type_error with reason non_alphabetic or wrong_length
         */
        static chunk_type parse(std::string_view text);

        // True for A-Z and a-z
        static constexpr bool is_type_byte(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] const std::array<std::uint8_t, size>& bytes() const { return m_code; }

        // Write the 4 type bytes to dest
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_code.data(), size);
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_code.data()), size};
        }

        std::uint8_t operator[](std::size_t i) const { return m_code[i]; }

        [[nodiscard]] bool is_critical() const { return is_upper(m_code[0]); }
        [[nodiscard]] bool is_ancillary() const { return !is_critical(); }
        [[nodiscard]] bool is_public() const { return is_upper(m_code[1]); }
        [[nodiscard]] bool is_private() const { return !is_public(); }
        [[nodiscard]] bool is_reserved_bit_valid() const { return is_upper(m_code[2]); }
        [[nodiscard]] bool is_safe_to_copy() const { return !is_upper(m_code[3]); }

        // A type is valid when its reserved bit is clear
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_code == o.m_code; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_code < o.m_code; }
        bool operator<=(const chunk_type& o) const { return m_code <= o.m_code; }
        bool operator>(const chunk_type& o) const { return m_code > o.m_code; }
        bool operator>=(const chunk_type& o) const { return m_code >= o.m_code; }

    private:
        struct unchecked_tag {};

        chunk_type(const std::array<std::uint8_t, size>& code, unchecked_tag)
            : m_code(code) {}

        // Letters only differ by bit 5; uppercase has it cleared
        static constexpr bool is_upper(std::uint8_t c) {
            return (c & 0x20) == 0;
        }

        std::array<std::uint8_t, size> m_code;
    };

    // Streams the 4 characters unquoted
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
