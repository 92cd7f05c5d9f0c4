//
// Created by igor on 02/09/2025.
//

#include <pngchunk/exceptions.hh>
#include <iomanip>

namespace pngchunk {

    const char* to_string(error_code code) {
        switch (code) {
            case error_code::truncated:
                return "truncated";
            case error_code::invalid_type:
                return "invalid_type";
            case error_code::checksum_mismatch:
                return "checksum_mismatch";
            case error_code::size_limit:
                return "size_limit";
            case error_code::non_text_payload:
                return "non_text_payload";
            case error_code::payload_too_large:
                return "payload_too_large";
        }
        // make compiler happy
        return "unknown";
    }

    const char* to_string(chunk_field field) {
        switch (field) {
            case chunk_field::length:
                return "length";
            case chunk_field::type:
                return "type";
            case chunk_field::payload:
                return "payload";
            case chunk_field::crc:
                return "crc";
        }
        return "unknown";
    }

    namespace {
        std::string hex32(std::uint32_t v) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << v;
            return oss.str();
        }
    }

    truncated_error::truncated_error(chunk_field field, std::uint64_t expected, std::uint64_t available)
        : parse_error(error_code::truncated,
                      build_error_msg("Truncated chunk: ", to_string(field), " field needs ", expected,
                                      " bytes, only ", available, " available"))
        , m_field(field)
        , m_expected(expected)
        , m_available(available) {}

    invalid_type_error::invalid_type_error(std::size_t position, std::uint8_t byte, std::size_t actual_length)
        : parse_error(error_code::invalid_type,
                      build_error_msg("Invalid chunk type: byte ", position, " is 0x",
                                      std::hex, std::setfill('0'), std::setw(2), static_cast<unsigned>(byte),
                                      std::dec, ", characters can only be alphabetic (A-Z, a-z)"))
        , m_reason(reason_t::non_alphabetic)
        , m_actual_length(actual_length)
        , m_position(position)
        , m_byte(byte) {}

    invalid_type_error::invalid_type_error(std::size_t actual_length)
        : parse_error(error_code::invalid_type,
                      build_error_msg("Invalid chunk type: expected ", expected_length,
                                      " characters, found ", actual_length))
        , m_reason(reason_t::wrong_length)
        , m_actual_length(actual_length) {}

    checksum_mismatch_error::checksum_mismatch_error(std::uint32_t stored, std::uint32_t computed)
        : parse_error(error_code::checksum_mismatch,
                      build_error_msg("Checksum mismatch: stored ", hex32(stored), " (", stored,
                                      "), computed ", hex32(computed), " (", computed, ")"))
        , m_stored(stored)
        , m_computed(computed) {}

    non_text_payload_error::non_text_payload_error(std::size_t offset)
        : chunk_error(error_code::non_text_payload,
                      build_error_msg("Payload is not valid UTF-8: invalid sequence at offset ", offset))
        , m_offset(offset) {}

    payload_too_large_error::payload_too_large_error(std::uint64_t size, std::uint64_t limit)
        : chunk_error(error_code::payload_too_large,
                      build_error_msg("Payload of ", size, " bytes exceeds the chunk length limit of ",
                                      limit, " bytes"))
        , m_size(size)
        , m_limit(limit) {}

} // namespace pngchunk
