//
// Test the subcommands of the command line tool against scratch files
//

#include <doctest/doctest.h>
#include <pngstash/png.hh>
#include <pngstash/exceptions.hh>
#include <sstream>
#include <string>
#include <vector>

#include "commands.hh"
#include "test_utils.hh"

using namespace pngstash;

namespace {
    struct run_result {
        int status;
        std::string out;
        std::string err;
    };

    run_result run_tool(const std::vector<std::string>& args) {
        std::ostringstream out;
        std::ostringstream err;
        int status = cli::run(args, out, err);
        return {status, out.str(), err.str()};
    }

    std::filesystem::path fresh_sample(const std::string& name) {
        auto path = scratch_path(name);
        write_scratch(path, sample_png());
        return path;
    }
}

TEST_SUITE("COMMANDS") {
    TEST_CASE("file helpers") {
        auto path = scratch_path("helpers.png");
        auto data = sample_png();
        cli::write_file(path, data);
        CHECK(cli::read_file(path) == data);

        try {
            (void)cli::read_file(scratch_path("does_not_exist.png"));
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.kind() == error_kind::io);
            CHECK(std::string(e.what()).find("does_not_exist.png") != std::string::npos);
        }
    }

    TEST_CASE("encode") {
        SUBCASE("to an output file") {
            auto input = fresh_sample("encode_in.png");
            auto output = scratch_path("encode_out.png");

            auto r = run_tool({"encode", input.string(), "RuSt", "secret message", "-o", output.string()});
            CHECK(r.status == 0);
            CHECK(r.out.find("RuSt") != std::string::npos);

            // input untouched
            CHECK(read_scratch(input) == sample_png());

            auto p = png::parse(read_scratch(output));
            REQUIRE(p.chunks().size() == 4);
            CHECK(p.chunks().back().type().to_text() == "RuSt");
            CHECK(p.chunks().back().payload_as_text() == "secret message");
        }

        SUBCASE("in place") {
            auto input = fresh_sample("encode_in_place.png");
            auto r = run_tool({"encode", input.string(), "ruSt", "second"});
            CHECK(r.status == 0);

            auto p = png::parse(read_scratch(input));
            CHECK(p.chunks().size() == 4);
            CHECK(p.chunks_by_type(chunk_type::from_text("ruSt")).size() == 2);
        }

        SUBCASE("invalid chunk type") {
            auto input = fresh_sample("encode_bad_type.png");
            auto r = run_tool({"encode", input.string(), "Ru1t", "nope"});
            CHECK(r.status == 1);
            CHECK(r.err.find("invalid_chunk_type_chars") != std::string::npos);
            CHECK(read_scratch(input) == sample_png());
        }
    }

    TEST_CASE("decode") {
        auto input = fresh_sample("decode.png");

        SUBCASE("prints the message") {
            auto r = run_tool({"decode", input.string(), "ruSt"});
            CHECK(r.status == 0);
            CHECK(r.out == "hidden\n");
        }

        SUBCASE("missing chunk") {
            auto r = run_tool({"decode", input.string(), "RuSt"});
            CHECK(r.status == 1);
            CHECK(r.err.find("chunk_not_found") != std::string::npos);
        }

        SUBCASE("output option is rejected") {
            auto r = run_tool({"decode", input.string(), "ruSt", "-o", "x.png"});
            CHECK(r.status == 2);
        }
    }

    TEST_CASE("remove") {
        SUBCASE("in place") {
            auto input = fresh_sample("remove.png");
            auto r = run_tool({"remove", input.string(), "ruSt"});
            CHECK(r.status == 0);
            CHECK(r.out.find("hidden") != std::string::npos);
            CHECK(read_scratch(input) == make_png({ihdr_frame(), iend_frame()}));
        }

        SUBCASE("binary payload") {
            auto input = scratch_path("remove_binary.png");
            write_scratch(input, make_png({make_frame("biNa", to_bytes({0xFF, 0xFE, 0x00})), iend_frame()}));
            auto output = scratch_path("remove_binary_out.png");

            auto r = run_tool({"remove", input.string(), "biNa", "--output", output.string()});
            CHECK(r.status == 0);
            CHECK(r.out.find("<3 bytes>") != std::string::npos);
            CHECK(read_scratch(output) == make_png({iend_frame()}));
        }

        SUBCASE("missing chunk keeps the file") {
            auto input = fresh_sample("remove_missing.png");
            auto r = run_tool({"remove", input.string(), "NoNe"});
            CHECK(r.status == 1);
            CHECK(r.err.find("chunk_not_found") != std::string::npos);
            CHECK(read_scratch(input) == sample_png());
        }
    }

    TEST_CASE("print") {
        SUBCASE("lists chunks") {
            auto input = fresh_sample("print.png");
            auto r = run_tool({"print", input.string()});
            CHECK(r.status == 0);
            CHECK(r.out.find("#0 at offset 8") != std::string::npos);
            CHECK(r.out.find("Type: IHDR") != std::string::npos);
            CHECK(r.out.find("Type: ruSt") != std::string::npos);
            CHECK(r.out.find("ancillary, private, safe-to-copy") != std::string::npos);
            CHECK(r.out.find("critical, public, unsafe-to-copy") != std::string::npos);
            CHECK(r.out.find("3 chunk(s)") != std::string::npos);
        }

        SUBCASE("lenient flag turns trailing bytes into a warning") {
            auto input = scratch_path("print_trailing.png");
            auto data = sample_png();
            append(data, to_bytes({1, 2, 3}));
            write_scratch(input, data);

            auto strict = run_tool({"print", input.string()});
            CHECK(strict.status == 1);
            CHECK(strict.err.find("trailing_bytes") != std::string::npos);

            auto lenient = run_tool({"print", input.string(), "--lenient"});
            CHECK(lenient.status == 0);
            CHECK(lenient.err.find("warning: [trailing_bytes]") != std::string::npos);
            CHECK(lenient.out.find("3 chunk(s)") != std::string::npos);
        }

        SUBCASE("not a png") {
            auto input = scratch_path("not_png.txt");
            write_scratch(input, to_bytes("just some text"));
            auto r = run_tool({"print", input.string()});
            CHECK(r.status == 1);
            CHECK(r.err.find("invalid_signature") != std::string::npos);
        }
    }

    TEST_CASE("usage errors") {
        CHECK(run_tool({}).status == 2);
        CHECK(run_tool({"explode", "file.png"}).status == 2);
        CHECK(run_tool({"decode", "file.png"}).status == 2);
        CHECK(run_tool({"print"}).status == 2);
        CHECK(run_tool({"encode", "a.png", "ruSt", "msg", "-o"}).status == 2);
        CHECK(run_tool({"print", "a.png", "--verbose"}).status == 2);

        auto help = run_tool({"--help"});
        CHECK(help.status == 0);
        CHECK(help.out.find("Usage:") != std::string::npos);

        auto missing = run_tool({"print", scratch_path("missing.png").string()});
        CHECK(missing.status == 1);
        CHECK(missing.err.find("error: io") != std::string::npos);
    }
}
