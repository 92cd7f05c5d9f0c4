#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <unordered_map>
#include <set>
#include <map>

using namespace pngchunk;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from byte array") {
            const std::array<std::uint8_t, 4> code{82, 117, 83, 116};
            chunk_type t(code);
            CHECK(t.bytes() == code);
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("from text") {
            chunk_type expected(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            CHECK(chunk_type::parse("RuSt") == expected);
        }

        SUBCASE("from raw bytes") {
            unsigned char bytes[4] = {'I', 'H', 'D', 'R'};
            chunk_type t = chunk_type::from_bytes(bytes);
            CHECK(t.to_string() == "IHDR");
            CHECK(t[0] == 'I');
            CHECK(t[3] == 'R');
        }

        SUBCASE("to_bytes") {
            auto t = chunk_type::parse("tEXt");
            unsigned char bytes[4];
            t.to_bytes(bytes);
            CHECK(bytes[0] == 't');
            CHECK(bytes[1] == 'E');
            CHECK(bytes[2] == 'X');
            CHECK(bytes[3] == 't');
        }
    }

    TEST_CASE("chunk_type byte validation") {
        SUBCASE("every letter accepted, everything else rejected") {
            for (int b = 0; b < 256; b++) {
                auto c = static_cast<std::uint8_t>(b);
                bool letter = (b >= 0x41 && b <= 0x5A) || (b >= 0x61 && b <= 0x7A);
                CHECK(chunk_type::is_type_byte(c) == letter);

                std::array<std::uint8_t, 4> code{'a', 'b', c, 'd'};
                if (letter) {
                    CHECK_NOTHROW(chunk_type{code});
                } else {
                    CHECK_THROWS_AS(chunk_type{code}, invalid_type_error);
                }
            }
        }

        SUBCASE("boundary bytes") {
            CHECK_THROWS_AS(chunk_type(std::array<std::uint8_t, 4>{0x40, 'A', 'A', 'A'}), invalid_type_error);
            CHECK_THROWS_AS(chunk_type(std::array<std::uint8_t, 4>{0x5B, 'A', 'A', 'A'}), invalid_type_error);
            CHECK_THROWS_AS(chunk_type(std::array<std::uint8_t, 4>{0x60, 'A', 'A', 'A'}), invalid_type_error);
            CHECK_THROWS_AS(chunk_type(std::array<std::uint8_t, 4>{0x7B, 'A', 'A', 'A'}), invalid_type_error);
            CHECK_THROWS_AS(chunk_type(std::array<std::uint8_t, 4>{0xC1, 'A', 'A', 'A'}), invalid_type_error);
            CHECK_NOTHROW(chunk_type(std::array<std::uint8_t, 4>{'A', 'Z', 'a', 'z'}));
        }

        SUBCASE("error reports first offending byte") {
            try {
                chunk_type(std::array<std::uint8_t, 4>{'R', 'u', '1', '!'});
                FAIL("Should have thrown exception");
            } catch (const invalid_type_error& e) {
                CHECK(e.code() == error_code::invalid_type);
                CHECK(e.reason() == invalid_type_error::reason_t::non_alphabetic);
                REQUIRE(e.position().has_value());
                CHECK(*e.position() == 2);
                CHECK(e.byte() == '1');
                CHECK(e.actual_length() == 4);
            }
        }
    }

    TEST_CASE("chunk_type text parsing") {
        SUBCASE("digit rejected") {
            CHECK_THROWS_AS(chunk_type::parse("Ru1t"), invalid_type_error);
        }

        SUBCASE("wrong length") {
            for (auto text : {"", "R", "RuS", "RuStX", "abcdefgh"}) {
                try {
                    chunk_type::parse(text);
                    FAIL("Should have thrown exception");
                } catch (const invalid_type_error& e) {
                    CHECK(e.reason() == invalid_type_error::reason_t::wrong_length);
                    CHECK(e.actual_length() == std::string_view(text).size());
                    CHECK_FALSE(e.position().has_value());
                }
            }
        }

        SUBCASE("alphabetic check takes precedence over length") {
            try {
                chunk_type::parse("ab1");
                FAIL("Should have thrown exception");
            } catch (const invalid_type_error& e) {
                CHECK(e.reason() == invalid_type_error::reason_t::non_alphabetic);
                CHECK(*e.position() == 2);
                CHECK(e.actual_length() == 3);
            }

            try {
                chunk_type::parse("RuSt!!");
                FAIL("Should have thrown exception");
            } catch (const invalid_type_error& e) {
                CHECK(e.reason() == invalid_type_error::reason_t::non_alphabetic);
                CHECK(*e.position() == 4);
            }
        }

        SUBCASE("multi-byte characters are not letters") {
            // "é" is two UTF-8 bytes, neither alphabetic ASCII
            CHECK_THROWS_AS(chunk_type::parse("ab\xC3\xA9"), invalid_type_error);
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("RuSt") {
            auto t = chunk_type::parse("RuSt");
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_ancillary());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_private());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
            CHECK(t.is_valid());
        }

        SUBCASE("Rust has reserved bit set") {
            auto t = chunk_type::parse("Rust");
            CHECK_FALSE(t.is_reserved_bit_valid());
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("each byte controls one property") {
            CHECK_FALSE(chunk_type::parse("ruSt").is_critical());
            CHECK(chunk_type::parse("RUSt").is_public());
            CHECK_FALSE(chunk_type::parse("RuST").is_safe_to_copy());
        }

        SUBCASE("standard PNG types") {
            auto ihdr = chunk_type::parse("IHDR");
            CHECK(ihdr.is_critical());
            CHECK(ihdr.is_public());
            CHECK(ihdr.is_valid());
            CHECK_FALSE(ihdr.is_safe_to_copy());

            auto text = chunk_type::parse("tEXt");
            CHECK(text.is_ancillary());
            CHECK(text.is_public());
            CHECK(text.is_valid());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type comparison and rendering") {
        SUBCASE("equality is byte-wise") {
            CHECK(chunk_type::parse("IDAT") == chunk_type::parse("IDAT"));
            CHECK(chunk_type::parse("IDAT") != chunk_type::parse("IDAt"));
        }

        SUBCASE("ordering") {
            CHECK(chunk_type::parse("IDAT") < chunk_type::parse("IEND"));
            CHECK(chunk_type::parse("IEND") > chunk_type::parse("IDAT"));
            CHECK(chunk_type::parse("IHDR") <= chunk_type::parse("IHDR"));

            std::set<chunk_type> types{chunk_type::parse("IEND"), chunk_type::parse("IDAT"),
                                       chunk_type::parse("IHDR")};
            CHECK(types.begin()->to_string() == "IDAT");
        }

        SUBCASE("stream output") {
            std::ostringstream oss;
            oss << chunk_type::parse("RuSt");
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("hashing") {
            std::unordered_map<chunk_type, int> counts;
            counts[chunk_type::parse("IDAT")]++;
            counts[chunk_type::parse("IDAT")]++;
            counts[chunk_type::parse("IEND")]++;
            CHECK(counts.size() == 2);
            CHECK(counts[chunk_type::parse("IDAT")] == 2);

            CHECK(std::hash<chunk_type>{}(chunk_type::parse("IDAT")) ==
                  chunk_type_hash{}(chunk_type::parse("IDAT")));
        }
    }
}
