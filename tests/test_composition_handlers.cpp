#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <string>
#include <utility>

#include "jcomp/composition_handlers.h"
#include "jcomp/indexed_content_wrapper.h"
#include "temp_dir.h"

using jcomp::CompositionContext;
using jcomp::CompositionOptions;
using jcomp::CompositionStatus;
using jcomp::json;
using jcomp::Pointer;

// =============================================================================
// Tests for individual composition handlers
// =============================================================================

namespace {

bool is_reference(const json& node) {
    return node.is_object() && (node.contains("!ref") || node.contains("!xref"));
}

// Content, options and context for one handler under test.
struct Fixture {
    jcomp::IndexedContentWrapper content;
    CompositionOptions           options;
    CompositionContext           context{ content, options, is_reference };

    explicit Fixture(json doc = json::object()) : content(std::move(doc)) {}
};

} // namespace

// ---------------------------------------------------------------------------
// Reference
// ---------------------------------------------------------------------------
TEST_CASE("ReferenceCompositionHandler: matches objects with \"!ref\"",
          "[handlers][reference]")
{
    Fixture f;
    jcomp::ReferenceCompositionHandler handler(f.context);

    REQUIRE(handler.match(json{ { "!ref", "/a" } }));
    REQUIRE(handler.match(json{ { "!ref", "/a" }, { "extra", 1 } }));
    REQUIRE_FALSE(handler.match(json{ { "ref", "/a" } }));
    REQUIRE_FALSE(handler.match(json("!ref /a")));
    REQUIRE_FALSE(handler.match(json::array({ "!ref" })));
}

TEST_CASE("ReferenceCompositionHandler: copies the target",
          "[handlers][reference]")
{
    Fixture f(json::parse(R"({"a": {"x": [1, 2]}, "b": null})"));
    jcomp::ReferenceCompositionHandler handler(f.context);

    auto result = handler.compose(json{ { "!ref", "/a" } }, Pointer::parse("/b"));
    REQUIRE(result.status == CompositionStatus::success);
    REQUIRE(result.value == json::parse(R"({"x": [1, 2]})"));
}

TEST_CASE("ReferenceCompositionHandler: missing target is retried",
          "[handlers][reference]")
{
    Fixture f(json::parse(R"({"b": null})"));
    jcomp::ReferenceCompositionHandler handler(f.context);

    auto result = handler.compose(json{ { "!ref", "/later" } }, Pointer::parse("/b"));
    REQUIRE(result.status == CompositionStatus::retry);
}

TEST_CASE("ReferenceCompositionHandler: invalid payloads",
          "[handlers][reference]")
{
    Fixture f(json::parse(R"({"b": null})"));
    jcomp::ReferenceCompositionHandler handler(f.context);
    const Pointer at = Pointer::parse("/b");

    REQUIRE_THROWS_AS(handler.compose(json{ { "!ref", "" } }, at), jcomp::InvalidOperationError);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!ref", "a/b" } }, at), jcomp::SyntaxError);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!ref", 5 } }, at), jcomp::SyntaxError);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!ref", "!file x.json" } }, at), jcomp::SyntaxError);
}

TEST_CASE("ReferenceCompositionHandler: self and ancestor references are cycles",
          "[handlers][reference][cycle]")
{
    Fixture f(json::parse(R"({"a": {"b": {"!ref": "/a"}}})"));
    jcomp::ReferenceCompositionHandler handler(f.context);

    REQUIRE_THROWS_AS(handler.compose(json{ { "!ref", "/a/b" } }, Pointer::parse("/a/b")), jcomp::CycleError);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!ref", "/a" } }, Pointer::parse("/a/b")), jcomp::CycleError);
}

TEST_CASE("ReferenceCompositionHandler: reference chains coming back are cycles",
          "[handlers][reference][cycle]")
{
    Fixture f(json::parse(R"({
        "a": {"!ref": "/b"},
        "b": {"!ref": "/c"},
        "c": {"!ref": "/a"},
        "d": {"!ref": "/e"},
        "e": {"!ref": "/missing"}
    })"));
    jcomp::ReferenceCompositionHandler handler(f.context);

    try {
        handler.compose(json{ { "!ref", "/b" } }, Pointer::parse("/a"));
        FAIL("expected CycleError");
    } catch (const jcomp::CycleError& err) {
        REQUIRE(std::string(err.what()).find("\"/a\" -> \"/b\" -> \"/c\" -> \"/a\"") != std::string::npos);
        REQUIRE(err.pointer().empty());
    }

    // A chain ending on a missing node just waits.
    auto result = handler.compose(json{ { "!ref", "/e" } }, Pointer::parse("/d"));
    REQUIRE(result.status == CompositionStatus::retry);
}

// ---------------------------------------------------------------------------
// Extended reference
// ---------------------------------------------------------------------------
TEST_CASE("ExtendedReferenceCompositionHandler: extend and delete apply to the copy",
          "[handlers][xref]")
{
    Fixture f(json::parse(R"({"base": {"a": 1, "b": {"c": 2}, "d": [1, 2]}})"));
    jcomp::ExtendedReferenceCompositionHandler handler(f.context);

    auto result = handler.compose(json::parse(R"({
        "!xref": "/base",
        "$extend": {"/a": 10, "/b/e": 3, "/d/-": 3},
        "$delete": ["/b/c"]
    })"), Pointer::parse("/x"));

    REQUIRE(result.status == CompositionStatus::success);
    REQUIRE(result.value == json::parse(R"({"a": 10, "b": {"e": 3}, "d": [1, 2, 3]})"));
    REQUIRE(f.content.get("/base") == json::parse(R"({"a": 1, "b": {"c": 2}, "d": [1, 2]})"));
}

TEST_CASE("ExtendedReferenceCompositionHandler: \"!\" spelled modifiers",
          "[handlers][xref]")
{
    Fixture f(json::parse(R"({"base": {"a": 1, "b": 2}})"));
    jcomp::ExtendedReferenceCompositionHandler handler(f.context);

    auto result = handler.compose(json::parse(R"({"!xref": "/base", "!delete": "/b"})"), Pointer::parse("/x"));
    REQUIRE(result.value == json::parse(R"({"a": 1})"));
}

TEST_CASE("ExtendedReferenceCompositionHandler: conditions gate the overlay",
          "[handlers][xref]")
{
    Fixture f(json::parse(R"({"base": {"a": 1}})"));
    jcomp::ExtendedReferenceCompositionHandler handler(f.context);
    const Pointer at = Pointer::parse("/x");

    auto waiting = handler.compose(json::parse(R"({"!xref": "/base", "$ifPresent": ["/b"]})"), at);
    REQUIRE(waiting.status == CompositionStatus::retry);

    auto blocked = handler.compose(json::parse(R"({"!xref": "/base", "$ifMissing": ["/a"]})"), at);
    REQUIRE(blocked.status == CompositionStatus::retry);

    auto ready = handler.compose(json::parse(
        R"({"!xref": "/base", "$ifPresent": ["/a"], "$ifMissing": ["/b"], "$extend": {"/b": 2}})"), at);
    REQUIRE(ready.status == CompositionStatus::success);
    REQUIRE(ready.value == json::parse(R"({"a": 1, "b": 2})"));
}

TEST_CASE("ExtendedReferenceCompositionHandler: overlays need an object target",
          "[handlers][xref]")
{
    Fixture f(json::parse(R"({"list": [1, 2]})"));
    jcomp::ExtendedReferenceCompositionHandler handler(f.context);
    const Pointer at = Pointer::parse("/x");

    auto plain = handler.compose(json{ { "!xref", "/list" } }, at);
    REQUIRE(plain.status == CompositionStatus::success);
    REQUIRE(plain.value == json::array({ 1, 2 }));

    REQUIRE_THROWS_AS(handler.compose(json::parse(R"({"!xref": "/list", "$delete": ["/0"]})"), at),
                      jcomp::InvalidOperationError);
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------
TEST_CASE("FileReferenceCompositionHandler: loads JSON relative to base_dir",
          "[handlers][file]")
{
    TempDir dir;
    dir.write("data/user.json", R"({"name": "Alex", "ref": {"!ref": "/a"}})");

    Fixture f;
    f.options.base_dir = dir.path();
    jcomp::FileReferenceCompositionHandler handler(f.context);

    auto result = handler.compose(json{ { "!file", "data/user.json" } }, Pointer::parse("/x"));
    REQUIRE(result.status == CompositionStatus::success);
    REQUIRE(result.value == json::parse(R"({"name": "Alex", "ref": {"!ref": "/a"}})"));

    REQUIRE_THROWS_AS(handler.compose(json{ { "!file", "data/none.json" } }, Pointer::parse("/x")),
                      jcomp::FileError);
}

TEST_CASE("FileReferenceCompositionHandler: cache serves later requests",
          "[handlers][file][cache]")
{
    TempDir dir;
    auto file = dir.write("v.json", R"({"v": 1})");

    Fixture f;
    f.options.base_dir  = dir.path();
    f.options.use_cache = true;
    jcomp::FileReferenceCompositionHandler handler(f.context);

    REQUIRE(handler.compose(json{ { "!file", "v.json" } }, Pointer::parse("/x")).value["v"] == 1);
    dir.write("v.json", R"({"v": 2})");
    REQUIRE(handler.compose(json{ { "!file", "./v.json" } }, Pointer::parse("/y")).value["v"] == 1);

    handler.invalidate_cache();
    REQUIRE(handler.compose(json{ { "!file", "v.json" } }, Pointer::parse("/x")).value["v"] == 2);
}

TEST_CASE("IncludeFileCompositionHandler: format and compose modifiers",
          "[handlers][include]")
{
    TempDir dir;
    dir.write("notes.txt", "hello");
    dir.write("doc.json", R"({"a": 1})");

    Fixture f;
    f.options.base_dir = dir.path();
    jcomp::IncludeFileCompositionHandler handler(f.context);
    const Pointer at = Pointer::parse("/x");

    auto text = handler.compose(json{ { "!include", "notes.txt" } }, at);
    REQUIRE(text.status == CompositionStatus::completed);
    REQUIRE(text.value == "hello");

    auto raw = handler.compose(json{ { "!include", "doc.json" }, { "$format", "text" } }, at);
    REQUIRE(raw.value == R"({"a": 1})");

    auto composed = handler.compose(json{ { "!include", "doc.json" }, { "$compose", true } }, at);
    REQUIRE(composed.status == CompositionStatus::compose_in_separate_context);
    REQUIRE(composed.value == json{ { "a", 1 } });

    REQUIRE_THROWS_AS(handler.compose(json{ { "!include", "doc.json" }, { "$compose", "yes" } }, at),
                      jcomp::InvalidOperationError);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!include", "doc.json" }, { "!format", "xml" } }, at),
                      jcomp::FileError);
}

// ---------------------------------------------------------------------------
// Generators and matchers
// ---------------------------------------------------------------------------
TEST_CASE("GeneratorCompositionHandler: passes args, kwargs and id",
          "[handlers][generator]")
{
    jcomp::GeneratorRegistry generators;
    generators.add("Echo", [](const json& args, const json& kwargs, std::mt19937&) {
        return json{ { "args", args }, { "kwargs", kwargs } };
    });
    int calls = 0;
    generators.add("Counter", [&calls](const json&, const json&, std::mt19937&) { return json(++calls); });

    Fixture f;
    f.options.generators = &generators;
    jcomp::GeneratorCompositionHandler handler(f.context);
    const Pointer at = Pointer::parse("/x");

    auto echo = handler.compose(json::parse(R"({"!gen": "Echo", "$args": [1], "$id": "e", "k": "v"})"), at);
    REQUIRE(echo.status == CompositionStatus::success);
    REQUIRE(echo.value == json::parse(R"({"args": [1], "kwargs": {"k": "v"}})"));

    auto bang = handler.compose(json::parse(R"({"!gen": "Echo", "!args": [2], "!id": 3})"), at);
    REQUIRE(bang.value == json::parse(R"({"args": [2], "kwargs": {}})"));

    REQUIRE(handler.compose(json::parse(R"({"!gen": "Counter", "!id": "x"})"), at).value == 1);
    REQUIRE(handler.compose(json::parse(R"({"!gen": "Counter", "$id": "x"})"), at).value == 1);
    REQUIRE(handler.compose(json::parse(R"({"!gen": "Counter"})"), at).value == 2);

    REQUIRE_THROWS_AS(handler.compose(json{ { "!gen", "Missing" } }, at), jcomp::InvalidOperationError);
}

TEST_CASE("GeneratorCompositionHandler: needs a registry",
          "[handlers][generator]")
{
    Fixture f;
    jcomp::GeneratorCompositionHandler handler(f.context);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!gen", "Number" } }, Pointer::parse("/x")),
                      jcomp::InvalidOperationError);
}

TEST_CASE("MatcherCompositionHandler: produces a validated descriptor",
          "[handlers][matcher]")
{
    auto matchers = jcomp::MatcherRegistry::with_builtins();

    Fixture f;
    f.options.matchers = &matchers;
    jcomp::MatcherCompositionHandler handler(f.context);
    const Pointer at = Pointer::parse("/x");

    auto result = handler.compose(json::parse(R"({"!match": "AnyNumberGreaterThan", "number": 3})"), at);
    REQUIRE(result.status == CompositionStatus::success);
    REQUIRE(result.value == jcomp::MatcherRegistry::descriptor("AnyNumberGreaterThan", json::array(),
                                                               json{ { "number", 3 } }));
    REQUIRE(matchers.from_descriptor(result.value)->matches(4));

    REQUIRE_THROWS_AS(handler.compose(json{ { "!match", "AnyNumberGreaterThan" } }, at),
                      jcomp::InvalidOperationError);
    REQUIRE_THROWS_AS(handler.compose(json{ { "!match", "NoSuchMatcher" } }, at),
                      jcomp::InvalidOperationError);
}

// ---------------------------------------------------------------------------
// HandlerRegistry
// ---------------------------------------------------------------------------
namespace {

class UpperCaseHandler : public jcomp::CompositionHandler {
public:
    using CompositionHandler::CompositionHandler;

    const char* definition_key() const noexcept override { return "!upper"; }

    jcomp::CompositionResult compose(const json& node, const Pointer&) override {
        std::string value = node.at("!upper").get<std::string>();
        for (auto& c : value) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return { CompositionStatus::success, value };
    }
};

} // namespace

TEST_CASE("HandlerRegistry: instantiates handlers in registration order",
          "[handlers][registry]")
{
    Fixture f;

    auto defaults = jcomp::HandlerRegistry::defaults();
    REQUIRE(defaults.size() == 6u);
    auto handlers = defaults.instantiate(f.context);
    REQUIRE(std::string(handlers.front()->definition_key()) == "!ref");
    REQUIRE(std::string(handlers.back()->definition_key()) == "!match");

    jcomp::HandlerRegistry custom;
    custom.add<UpperCaseHandler>();
    auto instances = custom.instantiate(f.context);
    REQUIRE(instances.size() == 1u);
    REQUIRE(instances[0]->compose(json{ { "!upper", "abc" } }, Pointer::parse("/x")).value == "ABC");
}
