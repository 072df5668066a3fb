#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

#include "jcomp/config.h"
#include "jcomp/logging.h"
#include "temp_dir.h"

using jcomp::EngineConfig;
using jcomp::json;

// =============================================================================
// Tests for EngineConfig and the logging settings it applies
// =============================================================================

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
TEST_CASE("EngineConfig: defaults",
          "[config]")
{
    EngineConfig config = EngineConfig::from_json(json::object());

    REQUIRE(config.wrapper == EngineConfig::Wrapper::indexed);
    REQUIRE(config.resolution == EngineConfig::Resolution::compose);
    REQUIRE_FALSE(config.enable_cache);
    REQUIRE(config.base_dir.empty());
    REQUIRE(config.max_passes == 1000u);
    REQUIRE(config.log_level == "warning");
}

TEST_CASE("EngineConfig: every key is read",
          "[config]")
{
    EngineConfig config = EngineConfig::from_json(json::parse(R"({
        "wrapper": "direct",
        "resolution": "references",
        "enable_cache": true,
        "base_dir": "fixtures",
        "max_passes": 12,
        "log_level": "debug"
    })"));

    REQUIRE(config.wrapper == EngineConfig::Wrapper::direct);
    REQUIRE(config.resolution == EngineConfig::Resolution::references);
    REQUIRE(config.enable_cache);
    REQUIRE(config.base_dir == "fixtures");
    REQUIRE(config.max_passes == 12u);
    REQUIRE(config.log_level == "debug");
}

TEST_CASE("EngineConfig: to_json round-trips",
          "[config]")
{
    EngineConfig config;
    config.wrapper      = EngineConfig::Wrapper::direct;
    config.resolution   = EngineConfig::Resolution::none;
    config.enable_cache = true;
    config.base_dir     = "data/x";
    config.max_passes   = 3;
    config.log_level    = "info";

    const json j = config.to_json();
    REQUIRE(EngineConfig::from_json(j).to_json() == j);
    REQUIRE(j["resolution"] == "none");
}

TEST_CASE("EngineConfig: invalid values raise ConfigError",
          "[config][errors]")
{
    REQUIRE_THROWS_AS(EngineConfig::from_json(json::array()), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "wrapper", "fast" } }), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "resolution", 1 } }), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "enable_cache", "yes" } }), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "max_passes", 0 } }), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "max_passes", -4 } }), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "log_level", "verbose" } }), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(json{ { "colour", "blue" } }), jcomp::ConfigError);
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------
TEST_CASE("EngineConfig: relative base_dir is taken from the config file location",
          "[config][file]")
{
    TempDir dir;
    auto file = dir.write("conf/engine.json", R"({"base_dir": "fixtures", "wrapper": "direct"})");

    EngineConfig config = EngineConfig::from_file(file);
    REQUIRE(config.wrapper == EngineConfig::Wrapper::direct);
    REQUIRE(config.base_dir == dir.path() / "conf" / "fixtures");
}

TEST_CASE("EngineConfig: unreadable config file raises ConfigError",
          "[config][file]")
{
    TempDir dir;
    auto broken = dir.write("broken.json", "{\"wrapper\": ");

    REQUIRE_THROWS_AS(EngineConfig::from_file(dir.path() / "absent.json"), jcomp::ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_file(broken), jcomp::ConfigError);
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
TEST_CASE("EngineConfig: apply() sets the log level",
          "[config][logging]")
{
    std::ostringstream out;
    jcomp::log::set_sink(out);

    EngineConfig config;
    config.log_level = "info";
    config.apply();

    JCOMP_INFO("loaded {} file(s)", 2);
    JCOMP_DEBUG("hidden {}", 1);

    const std::string text = out.str();
    REQUIRE(text.find("[INFO] test_config.cpp:") != std::string::npos);
    REQUIRE(text.find("loaded 2 file(s)") != std::string::npos);
    REQUIRE(text.find("hidden") == std::string::npos);

    config.log_level = "off";
    config.apply();
    JCOMP_ERROR("silent");
    REQUIRE(out.str().find("silent") == std::string::npos);

    jcomp::log::set_level(jcomp::log::warning);
    jcomp::log::set_sink(std::clog);
}
