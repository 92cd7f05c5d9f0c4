//
// Created by igor on 02/09/2025.
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>
#include <ostream>

namespace pngchunk {

    namespace {
        void validate_code(const std::array<std::uint8_t, chunk_type::size>& code) {
            for (std::size_t i = 0; i < code.size(); i++) {
                if (!chunk_type::is_type_byte(code[i])) {
                    throw invalid_type_error(i, code[i], code.size());
                }
            }
        }
    }

    chunk_type::chunk_type(const std::array<std::uint8_t, size>& code)
        : m_code(code) {
        validate_code(m_code);
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        std::array<std::uint8_t, size> code{};
        std::memcpy(code.data(), data, size);
        return chunk_type(code);
    }

    chunk_type chunk_type::parse(std::string_view text) {
        // Letters first, then length
        for (std::size_t i = 0; i < text.size(); i++) {
            auto c = static_cast<std::uint8_t>(text[i]);
            if (!is_type_byte(c)) {
                throw invalid_type_error(i, c, text.size());
            }
        }
        if (text.size() != size) {
            throw invalid_type_error(text.size());
        }

        std::array<std::uint8_t, size> code{};
        std::memcpy(code.data(), text.data(), size);
        return {code, unchecked_tag{}};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os.write(reinterpret_cast<const char*>(t.bytes().data()), chunk_type::size);
    }

} // namespace pngchunk
