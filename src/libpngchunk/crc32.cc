//
// Created by igor on 03/09/2025.
//

#include <pngchunk/crc32.hh>
#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32(const void* data, std::size_t size) {
        return crc32_accumulator().update(data, size).value();
    }

    crc32_accumulator::crc32_accumulator()
        : m_crc(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {}

    crc32_accumulator& crc32_accumulator::update(const void* data, std::size_t size) {
        auto* p = static_cast<const Bytef*>(data);
        uLong crc = m_crc;
        // zlib takes uInt lengths
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = ::crc32(crc, p, n);
            p += n;
            size -= n;
        }
        m_crc = static_cast<std::uint32_t>(crc);
        return *this;
    }

} // namespace pngchunk
