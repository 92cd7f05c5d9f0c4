//
// Created by igor on 04/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    // Bounded cursor over a caller-owned buffer. Every read names the wire
    // field it is for, so a short buffer surfaces as truncated_error.
    // A null buffer reads as empty whatever size it claims.
    class byte_reader {
        public:
            byte_reader(const void* data, std::size_t size);

            // Pointer to the next n bytes, advancing past them
            const std::byte* read_exact(std::size_t n, chunk_field field);

            // Big-endian 32-bit field
            std::uint32_t read_be32(chunk_field field);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
