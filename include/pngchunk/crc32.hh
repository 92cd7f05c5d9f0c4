/**
 * @file crc32.hh
 * @brief CRC-32 (ISO-HDLC) as used by PNG chunk trailers
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Compute CRC-32 of a single buffer
     *
     * Reflected polynomial 0x04C11DB7, initial value and final XOR
     * 0xFFFFFFFF. The check value for "123456789" is 0xCBF43926.
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const void* data, std::size_t size);

    /**
     * @class crc32_accumulator
     * @brief Incremental CRC-32 over several discontiguous spans
     *
     * Feeding spans one after the other yields the same value as crc32()
     * over their concatenation.
     */
    class PNGCHUNK_EXPORT crc32_accumulator {
    public:
        crc32_accumulator();

        crc32_accumulator& update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const { return m_crc; }

    private:
        std::uint32_t m_crc;
    };

} // namespace pngchunk
