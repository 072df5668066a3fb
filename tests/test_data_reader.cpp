#include <catch2/catch_test_macros.hpp>

#include <string>

#include "jcomp/data_reader.h"
#include "temp_dir.h"

using jcomp::DataReader;
using jcomp::json;

// =============================================================================
// Tests for DataReader
// =============================================================================

TEST_CASE("DataReader: reads and parses JSON files",
          "[data_reader][json]")
{
    TempDir dir;
    auto file = dir.write("data.json", R"({"a": [1, 2], "b": "x"})");

    REQUIRE(DataReader::read_json_file(file) == json::parse(R"({"a": [1, 2], "b": "x"})"));
    REQUIRE(DataReader::read_file(file) == json::parse(R"({"a": [1, 2], "b": "x"})"));
}

TEST_CASE("DataReader: text files are returned verbatim",
          "[data_reader][text]")
{
    TempDir dir;
    auto file = dir.write("notes.txt", "line 1\nline 2\n");

    REQUIRE(DataReader::read_text_file(file) == "line 1\nline 2\n");
    REQUIRE(DataReader::read_file(file) == "line 1\nline 2\n");
}

TEST_CASE("DataReader: explicit format overrides the extension",
          "[data_reader][format]")
{
    TempDir dir;
    auto json_as_txt = dir.write("data.txt", "[1, 2, 3]");
    auto text_as_json = dir.write("raw.json", "{\"k\": 1}");

    REQUIRE(DataReader::read_file(json_as_txt, "json") == json::array({ 1, 2, 3 }));
    REQUIRE(DataReader::read_file(json_as_txt, "JSON") == json::array({ 1, 2, 3 }));
    REQUIRE(DataReader::read_file(text_as_json, "text") == "{\"k\": 1}");
    REQUIRE_THROWS_AS(DataReader::read_file(json_as_txt, "yaml"), jcomp::FileError);
}

TEST_CASE("DataReader: format inference",
          "[data_reader][format]")
{
    REQUIRE(DataReader::infer_format("a/b.json") == "json");
    REQUIRE(DataReader::infer_format("a/b.JSON") == "json");
    REQUIRE(DataReader::infer_format("a/b.txt") == "text");
    REQUIRE(DataReader::infer_format("a/b") == "text");
}

TEST_CASE("DataReader: missing file raises FileError",
          "[data_reader][errors]")
{
    TempDir dir;
    REQUIRE_THROWS_AS(DataReader::read_json_file(dir.path() / "absent.json"), jcomp::FileError);
    REQUIRE_THROWS_AS(DataReader::read_text_file(dir.path() / "absent.txt"), jcomp::FileError);
}

TEST_CASE("DataReader: syntax errors name the file and the line",
          "[data_reader][errors]")
{
    TempDir dir;
    auto file = dir.write("broken.json", "{\n  \"a\": 1,\n  \"b\": ]\n}\n");

    try {
        DataReader::read_json_file(file);
        FAIL("expected FileError");
    } catch (const jcomp::FileError& err) {
        const std::string message = err.what();
        REQUIRE(message.find("broken.json") != std::string::npos);
        REQUIRE(message.find("line 3") != std::string::npos);
        REQUIRE(message.find("\"b\": ]") != std::string::npos);
    }
}

TEST_CASE("DataReader: empty JSON file is reported as empty",
          "[data_reader][errors]")
{
    TempDir dir;
    auto file = dir.write("empty.json", "  \n");

    try {
        DataReader::read_json_file(file);
        FAIL("expected FileError");
    } catch (const jcomp::FileError& err) {
        REQUIRE(std::string(err.what()).find("No content to parse") != std::string::npos);
    }
}
