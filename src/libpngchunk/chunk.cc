//
// Created by igor on 04/09/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/utf8.hh>
#include <ostream>
#include <iomanip>
#include <utility>

#include "input.hh"

namespace pngchunk {

    namespace {
        std::uint32_t compute_crc(const chunk_type& type, const std::byte* payload, std::size_t size) {
            return crc32_accumulator()
                .update(type.bytes().data(), chunk_type::size)
                .update(payload, size)
                .value();
        }

        std::uint32_t checked_length(std::size_t size) {
            if (static_cast<std::uint64_t>(size) > chunk::max_length) {
                throw payload_too_large_error(size, chunk::max_length);
            }
            return static_cast<std::uint32_t>(size);
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> payload)
        : m_length(checked_length(payload.size()))
        , m_type(type)
        , m_payload(std::move(payload))
        , m_crc(compute_crc(m_type, m_payload.data(), m_payload.size())) {}

    chunk::chunk(chunk_type type, const void* data, std::size_t size)
        : chunk(type, std::vector<std::byte>(static_cast<const std::byte*>(data),
                                             static_cast<const std::byte*>(data) + size)) {}

    chunk::chunk(chunk_type type, std::vector<std::byte> payload, std::uint32_t crc)
        : m_length(static_cast<std::uint32_t>(payload.size()))
        , m_type(type)
        , m_payload(std::move(payload))
        , m_crc(crc) {}

    chunk chunk::decode(const void* data, std::size_t size, const decode_options& options) {
        byte_reader in(data, size);

        auto length = in.read_be32(chunk_field::length);

        std::size_t type_offset = in.tell();
        auto type = chunk_type::from_bytes(in.read_exact(chunk_type::size, chunk_field::type));

        // Truncation is reported before the configured limit so a corrupted
        // length inside a short buffer always reads as truncated
        THROW_TRUNCATED_IF(chunk_field::payload, static_cast<std::uint64_t>(length),
                           static_cast<std::uint64_t>(in.remaining()));
        THROW_PARSE_IF(length > options.max_chunk_size, error_code::size_limit,
                       "Chunk '", type, "' declares ", length,
                       " bytes, exceeding maximum allowed size of ", options.max_chunk_size);

        const std::byte* payload = in.read_exact(length, chunk_field::payload);
        auto stored = in.read_be32(chunk_field::crc);

        std::uint32_t computed = compute_crc(type, payload, length);
        if (stored != computed) {
            throw checksum_mismatch_error(stored, computed);
        }

        if (options.on_warning) {
            if (!type.is_reserved_bit_valid()) {
                options.on_warning(type_offset, "reserved_bit",
                                   build_error_msg("Chunk type '", type, "' has the reserved bit set"));
            }
            if (in.remaining() > 0) {
                options.on_warning(in.tell(), "trailing_data",
                                   build_error_msg(in.remaining(), " bytes follow chunk '", type,
                                                   "' and were not decoded"));
            }
        }

        return {type, std::vector<std::byte>(payload, payload + length), stored};
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out(encoded_size());
        encode_to(out.data(), out.size());
        return out;
    }

    std::size_t chunk::encode_to(void* dst, std::size_t capacity) const {
        // Nothing is written unless the whole record fits
        if (capacity < encoded_size()) {
            const std::pair<chunk_field, std::size_t> fields[] = {
                {chunk_field::length, 4},
                {chunk_field::type, chunk_type::size},
                {chunk_field::payload, m_payload.size()},
                {chunk_field::crc, crc_size}
            };
            std::size_t left = capacity;
            for (const auto& [field, n] : fields) {
                THROW_TRUNCATED_IF(field, static_cast<std::uint64_t>(n), static_cast<std::uint64_t>(left));
                left -= n;
            }
        }

        auto* out = static_cast<std::byte*>(dst);
        store_be32(out, m_length);
        m_type.to_bytes(out + 4);
        if (!m_payload.empty()) {
            std::memcpy(out + header_size, m_payload.data(), m_payload.size());
        }
        store_be32(out + header_size + m_payload.size(), m_crc);
        return encoded_size();
    }

    std::string chunk::to_text() const {
        if (auto bad = utf8_invalid_offset(m_payload.data(), m_payload.size())) {
            throw non_text_payload_error(*bad);
        }
        return {reinterpret_cast<const char*>(m_payload.data()), m_payload.size()};
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length &&
               m_type == o.m_type &&
               m_crc == o.m_crc &&
               m_payload == o.m_payload;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << "chunk{type=" << c.type()
           << ", length=" << std::dec << c.length()
           << ", crc=0x" << std::hex << std::setfill('0') << std::setw(8) << c.crc()
           << "}";
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngchunk
