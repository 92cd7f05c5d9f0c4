/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 *
 * This file defines the exception hierarchy used by every fallible
 * operation of the library, and convenience macros for raising it.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <sstream>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum error_code
     * @brief Tag identifying the concrete failure carried by a chunk_error
     */
    enum class error_code {
        truncated,          ///< Fewer bytes than a field or the declared length needs
        invalid_type,       ///< Type field is not 4 ASCII letters
        checksum_mismatch,  ///< Stored CRC differs from the recomputed one
        size_limit,         ///< Declared length exceeds decode_options::max_chunk_size
        non_text_payload,   ///< Payload is not valid UTF-8
        payload_too_large   ///< Payload does not fit the 32-bit length field
    };

    /**
     * @enum chunk_field
     * @brief Wire fields of a chunk record, in the order they are laid out
     */
    enum class chunk_field {
        length,
        type,
        payload,
        crc
    };

    PNGCHUNK_EXPORT const char* to_string(error_code code);
    PNGCHUNK_EXPORT const char* to_string(chunk_field field);

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @class chunk_error
     * @brief Base exception class for all errors raised by the library
     *
     * Catching chunk_error catches everything; code() tells the variants apart
     * without a chain of catch clauses.
     */
    class PNGCHUNK_EXPORT chunk_error : public std::runtime_error {
    public:
        chunk_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class parse_error
     * @brief Exception for malformed wire data
     *
     * Thrown directly (with error_code::size_limit) when a decoded record
     * violates a configured limit; its subclasses cover truncation, bad
     * type fields and bad checksums.
     */
    class PNGCHUNK_EXPORT parse_error : public chunk_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : chunk_error(code, msg) {}
    };

    /**
     * @class truncated_error
     * @brief Not enough bytes for a fixed field or for the declared payload
     */
    class PNGCHUNK_EXPORT truncated_error : public parse_error {
    public:
        truncated_error(chunk_field field, std::uint64_t expected, std::uint64_t available);

        [[nodiscard]] chunk_field field() const noexcept { return m_field; }
        [[nodiscard]] std::uint64_t expected() const noexcept { return m_expected; }
        [[nodiscard]] std::uint64_t available() const noexcept { return m_available; }

    private:
        chunk_field m_field;
        std::uint64_t m_expected;
        std::uint64_t m_available;
    };

    /**
     * @class invalid_type_error
     * @brief Type field or type text rejected by chunk_type validation
     *
     * For non_alphabetic failures position() and byte() identify the first
     * offending character. For wrong_length failures the lengths differ.
     */
    class PNGCHUNK_EXPORT invalid_type_error : public parse_error {
    public:
        enum class reason_t {
            non_alphabetic,
            wrong_length
        };

        static constexpr std::size_t expected_length = 4;

        invalid_type_error(std::size_t position, std::uint8_t byte, std::size_t actual_length);
        explicit invalid_type_error(std::size_t actual_length);

        [[nodiscard]] reason_t reason() const noexcept { return m_reason; }
        [[nodiscard]] std::size_t actual_length() const noexcept { return m_actual_length; }
        [[nodiscard]] std::optional<std::size_t> position() const noexcept { return m_position; }
        [[nodiscard]] std::uint8_t byte() const noexcept { return m_byte; }

    private:
        reason_t m_reason;
        std::size_t m_actual_length;
        std::optional<std::size_t> m_position;
        std::uint8_t m_byte = 0;
    };

    /**
     * @class checksum_mismatch_error
     * @brief Stored CRC does not match the CRC of type and payload
     *
     * Signals corruption or a forged record.
     */
    class PNGCHUNK_EXPORT checksum_mismatch_error : public parse_error {
    public:
        checksum_mismatch_error(std::uint32_t stored, std::uint32_t computed);

        [[nodiscard]] std::uint32_t stored() const noexcept { return m_stored; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_stored;
        std::uint32_t m_computed;
    };

    /**
     * @class non_text_payload_error
     * @brief Payload requested as text is not valid UTF-8
     */
    class PNGCHUNK_EXPORT non_text_payload_error : public chunk_error {
    public:
        explicit non_text_payload_error(std::size_t offset);

        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @class payload_too_large_error
     * @brief Payload size cannot be represented in the 32-bit length field
     */
    class PNGCHUNK_EXPORT payload_too_large_error : public chunk_error {
    public:
        payload_too_large_error(std::uint64_t size, std::uint64_t limit);

        [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }
        [[nodiscard]] std::uint64_t limit() const noexcept { return m_limit; }

    private:
        std::uint64_t m_size;
        std::uint64_t m_limit;
    };

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     * @param code error_code carried by the exception
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(code, ...) \
        throw ::pngchunk::parse_error((code), ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     * @param condition Condition to check
     * @param code error_code carried by the exception
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_TRUNCATED_IF
     * @brief Throw a truncated_error when fewer than @p expected bytes are available
     */
    #define THROW_TRUNCATED_IF(field, expected, available) \
        do { if ((available) < (expected)) throw ::pngchunk::truncated_error((field), (expected), (available)); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
