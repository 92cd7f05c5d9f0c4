/**
 * @file decode_options.hh
 * @brief Options controlling chunk decoding
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @brief Largest length the PNG format allows in a chunk (2^31 - 1)
     *
     * Assign to decode_options::max_chunk_size to enforce it.
     */
    inline constexpr std::uint64_t png_max_chunk_length = 0x7FFFFFFFu;

    /**
     * @struct decode_options
     * @brief Configuration options for chunk::decode
     */
    struct decode_options {
        /**
         * @brief Maximum allowed declared length in bytes
         *
         * A record that declares a larger payload raises parse_error.
         * Default accepts every value the 32-bit length field can hold.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset inside the input where the issue was found
         * @param category Warning category ("trailing_data", "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * Called for non-fatal findings while decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
