/**
 * @file utf8.hh
 * @brief UTF-8 validation for textual payloads
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Locate the first invalid UTF-8 sequence
     * @param data Bytes to validate
     * @param size Number of bytes
     * @return Offset of the first byte of the invalid sequence, or nullopt if
     *         the whole buffer is well-formed UTF-8
     *
     * Validation follows RFC 3629: overlong encodings, UTF-16 surrogates,
     * code points above U+10FFFF, stray continuation bytes and sequences cut
     * off by the end of the buffer are all rejected.
     */
    PNGCHUNK_EXPORT std::optional<std::size_t> utf8_invalid_offset(const void* data, std::size_t size);

    inline bool is_valid_utf8(const void* data, std::size_t size) {
        return !utf8_invalid_offset(data, size).has_value();
    }

} // namespace pngchunk
