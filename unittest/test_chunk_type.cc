#include <doctest/doctest.h>
#include <pngstash/chunk_type.hh>
#include <pngstash/exceptions.hh>

#include <cctype>
#include <sstream>
#include <string>
#include <unordered_map>
#include <set>

using namespace pngstash;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from raw bytes") {
            std::array<std::uint8_t, 4> expected{82, 117, 83, 116};
            auto actual = chunk_type::from_bytes(expected);
            CHECK(actual.bytes() == expected);
        }

        SUBCASE("from text") {
            auto expected = chunk_type::from_bytes({82, 117, 83, 116});
            auto actual = chunk_type::from_text("RuSt");
            CHECK(actual == expected);
        }

        SUBCASE("from pointer") {
            const char raw[] = "IDATxxxx";
            auto t = chunk_type::from_bytes(raw);
            CHECK(t == chunk_type::from_text("IDAT"));
        }

        SUBCASE("from big-endian value") {
            auto t = chunk_type::from_uint32(0x52755374u);
            CHECK(t.to_text() == "RuSt");
            CHECK(t.to_uint32() == 0x52755374u);
        }

        SUBCASE("literal") {
            constexpr auto t = "IEND"_ctype;
            static_assert(t.is_critical());
            CHECK(t == chunk_type::from_text("IEND"));
        }

        SUBCASE("raw bytes are not validated") {
            auto t = chunk_type::from_bytes({0x00, 0xFF, 0x31, 0x7F});
            CHECK(t[0] == 0x00);
            CHECK(t[1] == 0xFF);
            CHECK_FALSE(t.is_alphabetic());
            CHECK_FALSE(t.is_valid());
        }
    }

    TEST_CASE("invalid text is rejected") {
        SUBCASE("digit") {
            try {
                (void)chunk_type::from_text("Ru1t");
                FAIL("Should have thrown exception");
            } catch (const format_error& e) {
                CHECK(e.kind() == error_kind::invalid_chunk_type_chars);
            }
        }

        SUBCASE("wrong length") {
            CHECK_THROWS_AS((void)chunk_type::from_text(""), format_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("Rus"), format_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("RuStt"), format_error);
        }

        SUBCASE("space and punctuation") {
            CHECK_THROWS_AS((void)chunk_type::from_text("CAT "), format_error);
            CHECK_THROWS_AS((void)chunk_type::from_text("a-bc"), format_error);
        }

        SUBCASE("non-ascii bytes") {
            // "Ru" followed by the two UTF-8 bytes of e-acute
            CHECK_THROWS_AS((void)chunk_type::from_text("Ru\xC3\xA9"), format_error);
        }
    }

    TEST_CASE("property bits") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_text("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_text("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_text("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_text("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_text("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_text("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_text("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_text("RuST").is_safe_to_copy());
        }

        SUBCASE("standard chunks") {
            auto ihdr = chunk_type::from_text("IHDR");
            CHECK(ihdr.is_critical());
            CHECK(ihdr.is_public());
            CHECK_FALSE(ihdr.is_safe_to_copy());

            auto text = chunk_type::from_text("tEXt");
            CHECK_FALSE(text.is_critical());
            CHECK(text.is_public());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("validity") {
        CHECK(chunk_type::from_text("RuSt").is_valid());
        CHECK_FALSE(chunk_type::from_text("Rust").is_valid());

        SUBCASE("valid exactly when the third letter is upper case") {
            const std::string letters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
            for (char a : std::string("Az")) {
                for (char b : std::string("Bq")) {
                    for (char c : letters) {
                        for (char d : std::string("Dt")) {
                            std::string text{a, b, c, d};
                            auto t = chunk_type::from_text(text);
                            bool upper = std::isupper(static_cast<unsigned char>(c)) != 0;
                            INFO("code: " << text);
                            CHECK(t.is_valid() == upper);
                            CHECK(t.is_reserved_bit_valid() == upper);
                        }
                    }
                }
            }
        }

        SUBCASE("reserved bit clear but not alphabetic") {
            auto t = chunk_type::from_bytes({'1', '2', 'A', 'B'});
            CHECK(t.is_reserved_bit_valid());
            CHECK_FALSE(t.is_valid());
        }
    }

    TEST_CASE("text conversion") {
        SUBCASE("round trip") {
            CHECK(chunk_type::from_text("RuSt").to_text() == "RuSt");
        }

        SUBCASE("invalid UTF-8 bytes") {
            auto t = chunk_type::from_bytes({0x80, 'A', 'B', 'C'});
            try {
                (void)t.to_text();
                FAIL("Should have thrown exception");
            } catch (const format_error& e) {
                CHECK(e.kind() == error_kind::not_text_representable);
                CHECK(std::string(e.what()).find("\\x80") != std::string::npos);
            }
        }

        SUBCASE("control characters are text") {
            auto t = chunk_type::from_bytes({0x01, 'a', 'B', 'c'});
            CHECK(t.to_text() == std::string("\x01" "aBc"));
        }

        SUBCASE("multi-byte UTF-8 is text") {
            auto t = chunk_type::from_bytes({0xC3, 0xA9, 'A', 'B'});
            CHECK(t.to_text() == "\xC3\xA9" "AB");
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("stream output") {
            std::ostringstream oss;
            oss << chunk_type::from_text("RuSt");
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("stream output escapes") {
            std::ostringstream oss;
            oss << chunk_type::from_bytes({'A', 0x01, 'C', 0xFF});
            CHECK(oss.str() == "A\\x01C\\xff");
        }

        SUBCASE("hex stream output") {
            std::ostringstream oss;
            oss << std::hex << chunk_type::from_text("RuSt") << " " << 10;
            CHECK(oss.str() == "0x52755374 a");
        }
    }

    TEST_CASE("comparison and hashing") {
        auto a = chunk_type::from_text("IDAT");
        auto b = chunk_type::from_text("IDAT");
        auto c = chunk_type::from_text("IdAT");

        CHECK(a == b);
        CHECK(a != c);
        CHECK(a < c);  // 'D' < 'd'

        std::unordered_map<chunk_type, int> counts;
        counts[a]++;
        counts[b]++;
        counts[c]++;
        CHECK(counts.size() == 2);
        CHECK(counts[a] == 2);

        std::set<chunk_type> ordered{c, a, b};
        CHECK(ordered.size() == 2);
        CHECK(*ordered.begin() == a);
    }
}
