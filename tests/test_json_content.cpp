#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "jcomp/json_content.h"
#include "temp_dir.h"

using jcomp::EngineConfig;
using jcomp::JsonContent;
using jcomp::json;

// =============================================================================
// Tests for the JsonContent facade
// =============================================================================

TEST_CASE("JsonContent: composes structured directives by default",
          "[json_content]")
{
    JsonContent content(json::parse(R"({"a": 100, "b": {"!ref": "/a"}})"));

    REQUIRE(content == json::parse(R"({"a": 100, "b": 100})"));
    REQUIRE(std::string(content.wrapper().kind()) == "indexed");
}

TEST_CASE("JsonContent: wrapper kind follows the config",
          "[json_content][config]")
{
    EngineConfig config;
    config.wrapper = EngineConfig::Wrapper::direct;

    JsonContent content(json::parse(R"({"a": 1})"), config);
    REQUIRE(std::string(content.wrapper().kind()) == "direct");
}

TEST_CASE("JsonContent: references mode resolves string directives only",
          "[json_content][config]")
{
    EngineConfig config;
    config.resolution = EngineConfig::Resolution::references;

    JsonContent content(json::parse(R"({"a": 1, "b": "!ref /a", "c": {"!ref": "/a"}})"), config);
    REQUIRE(content.get("/b") == 1);
    REQUIRE(content.get("/c") == json{ { "!ref", "/a" } });
}

TEST_CASE("JsonContent: resolution can be turned off",
          "[json_content][config]")
{
    EngineConfig config;
    config.resolution = EngineConfig::Resolution::none;

    const json doc = json::parse(R"({"b": "!ref /a", "c": {"!ref": "/a"}})");
    JsonContent content(doc, config);
    REQUIRE(content.document() == doc);
}

TEST_CASE("JsonContent: generators and matchers come from the caller",
          "[json_content]")
{
    auto generators = jcomp::GeneratorRegistry::with_builtins();
    auto matchers   = jcomp::MatcherRegistry::with_builtins();

    JsonContent content(json::parse(R"({
        "request":  {"id": {"!gen": "UUID", "$id": "req"}},
        "response": {"id": {"!ref": "/request/id"}, "count": {"!match": "AnyNumber"}}
    })"), EngineConfig{}, &generators, &matchers);

    REQUIRE(content.get("/request/id").is_string());
    REQUIRE(content.get("/response/id") == content.get("/request/id"));
    REQUIRE(matchers.deep_match(content.get("/response"),
                                json{ { "id", content.get("/request/id") }, { "count", 3 } }));
}

TEST_CASE("JsonContent: read and write access",
          "[json_content]")
{
    JsonContent content(json::parse(R"({"a": {"b": [1, 2]}})"));

    REQUIRE(content.has("/a/b/1"));
    REQUIRE_FALSE(content.has("/a/c"));
    REQUIRE(content.get_or_default("/a/c", "none") == "none");

    json copy = content.get_copy("/a/b");
    copy.push_back(3);
    REQUIRE(content.get("/a/b").size() == 2u);

    content.update("/a/c", true);
    REQUIRE(content.get("/a/c") == true);
    REQUIRE(content.remove("/a/b/0"));
    REQUIRE(content.get("/a/b") == json::array({ 2 }));

    std::vector<std::string> leaves;
    for (const auto& [ptr, value] : content.iterate()) leaves.push_back(ptr.rfc());
    REQUIRE(leaves == std::vector<std::string>{ "/a/b/0", "/a/c" });
}

TEST_CASE("JsonContent: from_file resolves files next to the loaded one",
          "[json_content][file]")
{
    TempDir dir;
    dir.write("cases/booking.json", R"({
        "defaults": {"!file": "defaults.json"},
        "name": {"!ref": "/defaults/name"}
    })");
    dir.write("cases/defaults.json", R"({"name": "Lucia"})");

    JsonContent content = JsonContent::from_file(dir.path() / "cases" / "booking.json");
    REQUIRE(content.get("/name") == "Lucia");
    REQUIRE(content.config().base_dir == dir.path() / "cases");
}

TEST_CASE("JsonContent: composition errors abort construction",
          "[json_content][errors]")
{
    REQUIRE_THROWS_AS(JsonContent(json::parse(R"({"a": {"!ref": "/a"}})")), jcomp::CycleError);
    REQUIRE_THROWS_AS(JsonContent(json::parse(R"({"a": {"!ref": "/zzz"}})")),
                      jcomp::UnresolvableCompositionError);
    REQUIRE_THROWS_AS(JsonContent(json::parse(R"({"a": {"!gen": "Number"}})")), jcomp::CompositionError);
}

TEST_CASE("JsonContent: remove_all removes several nodes and skips missing ones",
          "[json_content]")
{
    JsonContent content(json::parse(R"({"a": 1, "b": {"c": 2, "d": 3}, "e": [1, 2]})"));

    REQUIRE(content.remove_all({ "/a", "/b/c", "/zzz", "/e/5" }) == 2u);
    REQUIRE(content == json::parse(R"({"b": {"d": 3}, "e": [1, 2]})"));
    REQUIRE(content.remove_all({}) == 0u);
}

TEST_CASE("JsonContent: updates resolve string directives in references mode",
          "[json_content][references]")
{
    EngineConfig config;
    config.resolution = EngineConfig::Resolution::references;

    JsonContent content(json::parse(R"({"a": 1, "list": [10, 20]})"), config);
    content.update("/b", json{ { "copy", "!ref /a" }, { "items", "!ref /list" } });

    REQUIRE(content.get("/b") == json::parse(R"({"copy": 1, "items": [10, 20]})"));
    REQUIRE_THROWS_AS(content.update("/c", "!ref /missing"), jcomp::ResolutionError);
    REQUIRE_FALSE(content.has("/c"));
}

TEST_CASE("JsonContent: invalidate_cache reloads cached files",
          "[json_content][references][cache]")
{
    TempDir dir;
    dir.write("data.json", R"({"v": 1})");

    EngineConfig config;
    config.resolution   = EngineConfig::Resolution::references;
    config.enable_cache = true;
    config.base_dir     = dir.path();

    JsonContent content(json::parse(R"({"first": "!file data.json"})"), config);
    REQUIRE(content.get("/first/v") == 1);

    dir.write("data.json", R"({"v": 2})");
    content.update("/cached", "!file data.json");
    REQUIRE(content.get("/cached/v") == 1);

    content.invalidate_cache();
    content.update("/fresh", "!file data.json");
    REQUIRE(content.get("/fresh/v") == 2);
}

TEST_CASE("JsonContent: invalidate_cache is harmless without a resolver",
          "[json_content][cache]")
{
    JsonContent content(json::parse(R"({"a": "!ref /b", "b": 1})"));

    REQUIRE_NOTHROW(content.invalidate_cache());
    content.update("/c", "!ref /b");
    REQUIRE(content.get("/c") == "!ref /b");
}
