/**
 * @file chunk_tool.cpp
 * @brief Encode a text message into a chunk, or inspect a hex-encoded chunk
 *
 * Minimal example of the pngchunk API. Input and output are hex strings on
 * the command line so the tool works without any file handling.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

namespace {
    std::string to_hex(const std::vector<std::byte>& bytes) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (auto b : bytes) {
            auto v = std::to_integer<unsigned>(b);
            out += digits[v >> 4];
            out += digits[v & 0x0F];
        }
        return out;
    }

    int hex_digit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool from_hex(const std::string& text, std::vector<std::byte>& out) {
        if (text.size() % 2 != 0) {
            return false;
        }
        out.clear();
        for (std::size_t i = 0; i < text.size(); i += 2) {
            int hi = hex_digit(text[i]);
            int lo = hex_digit(text[i + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out.push_back(std::byte((hi << 4) | lo));
        }
        return true;
    }

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " encode <TYPE> <message>\n";
        std::cout << "       " << prog << " decode <hex>\n";
        std::cout << "\n";
        std::cout << "Builds a chunk record from a message, or inspects an encoded one.\n";
    }

    void print_chunk(const pngchunk::chunk& c) {
        const auto& t = c.type();
        std::cout << c << "\n";
        std::cout << "  critical:     " << std::boolalpha << t.is_critical() << "\n";
        std::cout << "  public:       " << t.is_public() << "\n";
        std::cout << "  reserved ok:  " << t.is_reserved_bit_valid() << "\n";
        std::cout << "  safe to copy: " << t.is_safe_to_copy() << "\n";

        try {
            std::cout << "  text:         \"" << c.to_text() << "\"\n";
        } catch (const pngchunk::non_text_payload_error& e) {
            std::cout << "  text:         (binary, " << e.what() << ")\n";
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    try {
        if (command == "encode" && argc == 4) {
            std::string message = argv[3];
            pngchunk::chunk c(pngchunk::chunk_type::parse(argv[2]), message.data(), message.size());
            std::cout << to_hex(c.encode()) << "\n";
            return 0;
        }

        if (command == "decode" && argc == 3) {
            std::vector<std::byte> bytes;
            if (!from_hex(argv[2], bytes)) {
                std::cerr << "Error: '" << argv[2] << "' is not a hex string\n";
                return 1;
            }

            pngchunk::decode_options opts;
            opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
                std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
            };

            print_chunk(pngchunk::chunk::decode(bytes, opts));
            return 0;
        }
    } catch (const pngchunk::chunk_error& e) {
        std::cerr << "Error (" << pngchunk::to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
