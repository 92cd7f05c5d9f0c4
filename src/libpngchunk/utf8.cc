//
// Created by igor on 03/09/2025.
//

#include <pngchunk/utf8.hh>
#include <cstdint>

namespace pngchunk {

    std::optional<std::size_t> utf8_invalid_offset(const void* data, std::size_t size) {
        const auto* s = static_cast<const std::uint8_t*>(data);
        std::size_t i = 0;

        while (i < size) {
            std::uint8_t c = s[i];
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            // Bounds of the second byte narrow the ranges that would otherwise
            // allow overlong forms, surrogates and values past U+10FFFF
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) {
                    lo = 0xA0;
                } else if (c == 0xED) {
                    hi = 0x9F;
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) {
                    lo = 0x90;
                } else if (c == 0xF4) {
                    hi = 0x8F;
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }
            if (s[i + 1] < lo || s[i + 1] > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                if ((s[i + k] & 0xC0) != 0x80) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }

} // namespace pngchunk
