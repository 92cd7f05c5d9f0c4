//
// Created by igor on 04/09/2025.
//

#include "input.hh"
#include <pngchunk/endian.hh>

namespace pngchunk {

    byte_reader::byte_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(data ? size : 0), m_position(0) {}

    const std::byte* byte_reader::read_exact(std::size_t n, chunk_field field) {
        THROW_TRUNCATED_IF(field, static_cast<std::uint64_t>(n), static_cast<std::uint64_t>(remaining()));
        const std::byte* p = m_data + m_position;
        m_position += n;
        return p;
    }

    std::uint32_t byte_reader::read_be32(chunk_field field) {
        return load_be32(read_exact(sizeof(std::uint32_t), field));
    }
}
