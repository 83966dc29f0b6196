//
// Created by igor on 13/08/2025.
//

#include <doctest/doctest.h>
#include <vector>
#include <string>

#include <pngstash/chunk_iterator.hh>
#include <pngstash/parser.hh>
#include <pngstash/exceptions.hh>
#include "test_utils.hh"

using namespace pngstash;

TEST_CASE("test chunk iterator") {
    SUBCASE("iterate chunks in order") {
        auto buffer = sample_png();

        std::vector<std::string> chunk_ids;
        std::vector<std::uint64_t> offsets;
        std::vector<std::size_t> indices;

        chunk_iterator it(buffer);
        while (it.has_next()) {
            const auto& chunk = it.current();
            chunk_ids.push_back(chunk.value.type().to_text());
            offsets.push_back(chunk.file_offset);
            indices.push_back(chunk.index);
            it.next();
        }

        CHECK(it.at_end());
        CHECK(chunk_ids == std::vector<std::string>{"IHDR", "ruSt", "IEND"});
        // signature 8, IHDR frame 25, ruSt frame 18
        CHECK(offsets == std::vector<std::uint64_t>{8, 33, 51});
        CHECK(indices == std::vector<std::size_t>{0, 1, 2});
    }

    SUBCASE("empty chunk list") {
        auto buffer = png_signature();
        chunk_iterator it(buffer);
        CHECK_FALSE(it.has_next());
        CHECK(it.at_end());

        // advancing past the end is harmless
        it.next();
        CHECK(it.at_end());
    }

    SUBCASE("bad signature throws on construction") {
        auto buffer = sample_png();
        buffer[0] = std::byte{0x88};
        CHECK_THROWS_AS(chunk_iterator{buffer}, parse_error);
    }

    SUBCASE("error surfaces when the bad frame is reached") {
        auto buffer = make_png({ihdr_frame(), make_frame("ruSt", to_bytes("abc"), 7u)});

        chunk_iterator it(buffer);
        REQUIRE(it.has_next());
        CHECK(it.current().value.type().to_text() == "IHDR");
        CHECK_THROWS_AS(it.next(), crc_mismatch_error);
    }
}

TEST_CASE("for_each_chunk") {
    SUBCASE("visits every chunk") {
        auto buffer = sample_png();
        std::vector<std::string> seen;
        for_each_chunk(buffer, [&seen](const chunk_iterator::chunk_info& info) {
            seen.push_back(info.value.type().to_text());
        });
        CHECK(seen == std::vector<std::string>{"IHDR", "ruSt", "IEND"});
    }

    SUBCASE("chunks before a failure are delivered") {
        auto buffer = make_png({ihdr_frame(), make_frame("ruSt", "fine"), make_frame("baDd", to_bytes("x"), 0u)});
        std::vector<std::string> seen;
        try {
            for_each_chunk(buffer, [&seen](const auto& info) {
                seen.push_back(info.value.type().to_text());
            });
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::crc_mismatch);
        }
        CHECK(seen == std::vector<std::string>{"IHDR", "ruSt"});
    }

    SUBCASE("options are honored") {
        auto buffer = sample_png();
        append(buffer, to_bytes({0, 0, 0}));

        parse_options opts;
        opts.strict = false;
        std::size_t count = 0;
        for_each_chunk(buffer, [&count](const auto&) { count++; }, opts);
        CHECK(count == 3);

        CHECK_THROWS_AS(for_each_chunk(buffer, [](const auto&) {}), parse_error);
    }
}
