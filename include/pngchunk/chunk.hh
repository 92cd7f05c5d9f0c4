/**
 * @file chunk.hh
 * @brief PNG chunk record: length, type, payload and CRC
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief One length-prefixed, type-tagged, checksummed record
     *
     * Wire layout, all integers big-endian:
     * @code
     *   +--------+--------+-----------------+--------+
     *   | length |  type  | payload[length] |  crc   |
     *   |   4    |   4    |     length      |   4    |
     *   +--------+--------+-----------------+--------+
     * @endcode
     * The CRC covers type and payload only.
     *
     * A chunk always satisfies length() == payload().size() and
     * crc() == crc32(type ‖ payload). There are no mutators.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t header_size = 8;   ///< length + type
        static constexpr std::size_t crc_size = 4;
        static constexpr std::size_t overhead = header_size + crc_size;
        static constexpr std::uint64_t max_length = 0xFFFFFFFFu;

        /**
         * @brief Build a chunk from a type and a payload, computing the CRC
         * @throws payload_too_large_error if the payload exceeds max_length
         */
        chunk(chunk_type type, std::vector<std::byte> payload);

        /**
         * @brief Build a chunk copying @p size bytes from @p data
         * @throws payload_too_large_error if size exceeds max_length
         */
        chunk(chunk_type type, const void* data, std::size_t size);

        /**
         * @brief Decode one record from the start of a buffer
         *
         * Reads length, type, exactly length payload bytes and the CRC.
         * Bytes following the CRC are not consumed.
         *
         * @param data Start of the record
         * @param size Bytes available at @p data
         * @param options Size limit and warning callback
         * @return The decoded chunk
         * @throws truncated_error if the buffer ends inside a field or the payload
         * @throws invalid_type_error if the type field is not 4 letters
         * @throws parse_error if the declared length exceeds options.max_chunk_size
         * @throws checksum_mismatch_error if the stored CRC is wrong
         */
        static chunk decode(const void* data, std::size_t size, const decode_options& options = {});

        static chunk decode(const std::vector<std::byte>& bytes, const decode_options& options = {}) {
            return decode(bytes.data(), bytes.size(), options);
        }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& payload() const { return m_payload; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        // Bytes encode() produces
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_payload.size(); }

        /**
         * @brief Serialize to the wire layout
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Serialize into a caller buffer
         * @return Number of bytes written, always encoded_size()
         * @throws truncated_error naming the first field that does not fit
         */
        std::size_t encode_to(void* dst, std::size_t capacity) const;

        /**
         * @brief Payload viewed as UTF-8 text
         * @throws non_text_payload_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string to_text() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> payload, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_payload;
        std::uint32_t m_crc;
    };

    // Diagnostic summary: chunk{type=IHDR, length=13, crc=0x...}
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
