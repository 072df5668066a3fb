#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "data_reader.h"
#include "errors.h"
#include "json.h"
#include "logging.h"

namespace jcomp {

/**
 * Engine settings, usually read from a JSON file:
 *
 *   {
 *     "wrapper":      "indexed",     // "direct" | "indexed"
 *     "resolution":   "compose",     // "none" | "references" | "compose"
 *     "enable_cache": false,
 *     "base_dir":     "fixtures",
 *     "max_passes":   1000,
 *     "log_level":    "warning"      // "off" | "error" | "warning" | "info" | "debug"
 *   }
 *
 * Every key is optional.  Unknown keys and invalid values raise ConfigError.
 */
struct EngineConfig {
    enum class Wrapper { direct, indexed };
    enum class Resolution { none, references, compose };

    Wrapper               wrapper      = Wrapper::indexed;
    Resolution            resolution   = Resolution::compose;
    bool                  enable_cache = false;
    std::filesystem::path base_dir;
    std::size_t           max_passes   = 1000;
    std::string           log_level    = "warning";

    static EngineConfig from_json(const json& j) {
        if (!j.is_object()) {
            throw ConfigError("Engine configuration must be a JSON object, got " + std::string(j.type_name()) + ".");
        }

        EngineConfig config;
        for (const auto& item : j.items()) {
            const std::string& key = item.key();
            const json& value = item.value();

            if (key == "wrapper") {
                const std::string name = require_string(key, value);
                if (name == "direct")       config.wrapper = Wrapper::direct;
                else if (name == "indexed") config.wrapper = Wrapper::indexed;
                else throw invalid(key, value, "\"direct\" or \"indexed\"");
            } else if (key == "resolution") {
                const std::string name = require_string(key, value);
                if (name == "none")            config.resolution = Resolution::none;
                else if (name == "references") config.resolution = Resolution::references;
                else if (name == "compose")    config.resolution = Resolution::compose;
                else throw invalid(key, value, "\"none\", \"references\" or \"compose\"");
            } else if (key == "enable_cache") {
                if (!value.is_boolean()) throw invalid(key, value, "a boolean");
                config.enable_cache = value.get<bool>();
            } else if (key == "base_dir") {
                config.base_dir = require_string(key, value);
            } else if (key == "max_passes") {
                if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
                    throw invalid(key, value, "a positive integer");
                }
                config.max_passes = value.get<std::size_t>();
            } else if (key == "log_level") {
                const std::string name = require_string(key, value);
                if (name != "off" && name != "error" && name != "warning" && name != "info" && name != "debug") {
                    throw invalid(key, value, "one of \"off\", \"error\", \"warning\", \"info\", \"debug\"");
                }
                config.log_level = name;
            } else {
                throw ConfigError("Unknown engine configuration key \"" + key + "\".");
            }
        }
        return config;
    }

    /**
     * Read a configuration file.  A relative "base_dir" is taken relative to
     * the file's directory.
     */
    static EngineConfig from_file(const std::filesystem::path& path) {
        json j;
        try {
            j = DataReader::read_json_file(path);
        } catch (const FileError& err) {
            throw ConfigError(std::string("Failed to read engine configuration: ") + err.what());
        }
        EngineConfig config = from_json(j);
        if (config.base_dir.is_relative()) {
            config.base_dir = path.parent_path() / config.base_dir;
        }
        return config;
    }

    json to_json() const {
        return {
            { "wrapper",      wrapper == Wrapper::direct ? "direct" : "indexed" },
            { "resolution",   resolution == Resolution::none       ? "none"
                            : resolution == Resolution::references ? "references"
                                                                   : "compose" },
            { "enable_cache", enable_cache },
            { "base_dir",     base_dir.string() },
            { "max_passes",   max_passes },
            { "log_level",    log_level },
        };
    }

    /** Apply process-wide settings (the log level). */
    void apply() const {
        log::set_level(log::level_from_string(log_level));
    }

private:
    static std::string require_string(const std::string& key, const json& value) {
        if (!value.is_string()) throw invalid(key, value, "a string");
        return value.get<std::string>();
    }

    static ConfigError invalid(const std::string& key, const json& value, const std::string& expected) {
        return ConfigError("Invalid value " + value.dump() + " for \"" + key + "\": expected " + expected + ".");
    }
};

} // namespace jcomp
