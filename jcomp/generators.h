#pragma once

#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "errors.h"
#include "json.h"
#include "logging.h"

// =============================================================================
// jcomp::GeneratorRegistry
//
// Name -> generator function table consulted by the "!gen" directive.
//
// A generator receives its positional arguments as a JSON array, its named
// arguments as a JSON object and the registry's random engine:
//
//   registry.add("Number", [](const json& args, const json& kwargs, std::mt19937& rng) {...});
//   registry.generate("Number", {1, 10}, json::object(), std::nullopt);
//
// A correlation id makes generation idempotent: the first value produced for
// (name, id) is remembered and returned for every later request with the
// same pair until clear_correlations() is called.
// =============================================================================

namespace jcomp {

class GeneratorRegistry {
public:
    using Generator = std::function<json(const json& args, const json& kwargs, std::mt19937& rng)>;

    GeneratorRegistry() : rng_(std::random_device{}()) {}

    explicit GeneratorRegistry(std::uint32_t seed) : rng_(seed) {}

    /** Registry pre-populated with the built-in generators. */
    static GeneratorRegistry with_builtins() {
        GeneratorRegistry registry;
        registry.add_builtins();
        return registry;
    }

    // ---- registration ----

    /** Throws InvalidOperationError if `name` is taken and `override` is false. */
    void add(const std::string& name, Generator generator, bool override = false) {
        if (name.empty()) {
            throw InvalidOperationError("Generator name must not be empty.");
        }
        if (!override && generators_.count(name)) {
            throw InvalidOperationError("Generator \"" + name + "\" already registered!");
        }
        generators_[name] = std::move(generator);
    }

    bool remove(const std::string& name) { return generators_.erase(name) > 0; }

    bool contains(const std::string& name) const { return generators_.count(name) != 0; }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& entry : generators_) out.push_back(entry.first);
        return out;
    }

    void add_builtins();

    // ---- generation ----

    json generate(const std::string& name,
                  const json& args = json::array(),
                  const json& kwargs = json::object(),
                  const std::optional<std::string>& correlation_id = std::nullopt) {
        auto it = generators_.find(name);
        if (it == generators_.end()) {
            throw InvalidOperationError("Failed to find generator with name \"" + name + "\"!");
        }
        if (!args.is_array()) {
            throw InvalidOperationError("Arguments of generator \"" + name + "\" must be an array, got "
                                        + std::string(args.type_name()) + ".");
        }
        if (!kwargs.is_object()) {
            throw InvalidOperationError("Named arguments of generator \"" + name + "\" must be an object.");
        }

        std::string cache_key;
        if (correlation_id) {
            cache_key = name + "." + *correlation_id;
            auto cached = correlated_.find(cache_key);
            if (cached != correlated_.end()) {
                return cached->second;
            }
        }

        json value = it->second(args, kwargs, rng_);
        JCOMP_DEBUG("Generated value for \"{}\": {}", name, value.dump());

        if (correlation_id) {
            correlated_[cache_key] = value;
        }
        return value;
    }

    void clear_correlations() { correlated_.clear(); }

    void seed(std::uint32_t value) { rng_.seed(value); }

    // ---- argument helpers for generator implementations ----

    /** Named argument, else positional argument `index`, else `fallback`. */
    static json argument(const json& args, const json& kwargs, std::size_t index,
                         const std::string& name, json fallback) {
        auto it = kwargs.find(name);
        if (it != kwargs.end()) return *it;
        if (index < args.size()) return args[index];
        return fallback;
    }

private:
    std::map<std::string, Generator> generators_;
    std::map<std::string, json>      correlated_;
    std::mt19937                     rng_;
};

namespace generators {

inline const std::vector<std::string>& male_names() {
    static const std::vector<std::string> names{
        "James", "John", "Alex", "Keanu", "Michel", "Aaron", "Richard", "Ricardo" };
    return names;
}

inline const std::vector<std::string>& female_names() {
    static const std::vector<std::string> names{
        "Karen", "Kate", "Maria", "Marry", "Lucia", "Tiffany", "Aki", "Noelle" };
    return names;
}

inline const std::vector<std::string>& last_names() {
    static const std::vector<std::string> names{
        "Harris", "Robinson", "Walker", "Reaves", "Smith", "Levi",
        "Yamamoto", "Brodski", "Danielopoulos", "McNuggets", "Lopez", "Hernandez" };
    return names;
}

inline const std::string& pick(const std::vector<std::string>& from, std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, from.size() - 1);
    return from[dist(rng)];
}

inline json first_name(const json& args, const json& kwargs, std::mt19937& rng) {
    json gender = GeneratorRegistry::argument(args, kwargs, 0, "gender", "male");
    if (!gender.is_string()) {
        throw InvalidOperationError("FirstName: \"gender\" must be a string.");
    }
    std::string value = gender.get<std::string>();
    for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return pick(value == "female" ? female_names() : male_names(), rng);
}

inline json last_name(const json&, const json&, std::mt19937& rng) {
    return pick(last_names(), rng);
}

inline json number(const json& args, const json& kwargs, std::mt19937& rng) {
    json lo = GeneratorRegistry::argument(args, kwargs, 0, "min", 0);
    json hi = GeneratorRegistry::argument(args, kwargs, 1, "max", 100);
    if (!lo.is_number_integer() || !hi.is_number_integer()) {
        throw InvalidOperationError("Number: \"min\" and \"max\" must be integers.");
    }
    const auto low  = lo.get<std::int64_t>();
    const auto high = hi.get<std::int64_t>();
    if (low > high) {
        throw InvalidOperationError("Number: \"min\" (" + std::to_string(low)
                                    + ") is greater than \"max\" (" + std::to_string(high) + ").");
    }
    std::uniform_int_distribution<std::int64_t> dist(low, high);
    return dist(rng);
}

inline json text(const json& args, const json& kwargs, std::mt19937& rng) {
    static const std::string alphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    json length = GeneratorRegistry::argument(args, kwargs, 0, "length", 8);
    if (!length.is_number_integer() || length.get<std::int64_t>() < 0) {
        throw InvalidOperationError("Text: \"length\" must be a non-negative integer.");
    }
    std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);
    std::string out(length.get<std::size_t>(), ' ');
    for (auto& c : out) c = alphabet[dist(rng)];
    return out;
}

inline json choice(const json& args, const json& kwargs, std::mt19937& rng) {
    const json& options = kwargs.contains("options") ? kwargs["options"] : args;
    if (!options.is_array() || options.empty()) {
        throw InvalidOperationError("Choice: at least one option is required.");
    }
    std::uniform_int_distribution<std::size_t> dist(0, options.size() - 1);
    return options[dist(rng)];
}

inline json uuid(const json&, const json&, std::mt19937& rng) {
    static const char* hex = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) { out += '-'; continue; }
        if (i == 14) { out += '4'; continue; }
        int nibble = dist(rng);
        if (i == 19) nibble = (nibble & 0x3) | 0x8;
        out += hex[nibble];
    }
    return out;
}

} // namespace generators

inline void GeneratorRegistry::add_builtins() {
    add("FirstName", generators::first_name);
    add("LastName",  generators::last_name);
    add("Number",    generators::number);
    add("Text",      generators::text);
    add("Choice",    generators::choice);
    add("UUID",      generators::uuid);
}

} // namespace jcomp
