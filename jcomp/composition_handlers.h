#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "content_wrapper.h"
#include "data_reader.h"
#include "errors.h"
#include "generators.h"
#include "json.h"
#include "logging.h"
#include "matchers.h"
#include "pointer.h"

// =============================================================================
// jcomp composition handlers
//
// A directive is an object carrying a marker key.  Each handler recognizes
// one marker and turns the directive into a value:
//
//   {"!ref": "/a/b"}                               value at /a/b
//   {"!xref": "/a", "$extend": {...}, "$delete": [...]}
//   {"!file": "data.json"}                         parsed JSON file
//   {"!include": "notes.txt", "$format": "text", "$compose": false}
//   {"!gen": "Number", "$args": [1, 10], "$id": "x"}
//   {"!match": "AnyNumberGreaterThan", "number": 5}
//
// Modifier keys may be spelled with either "$" or "!" ("$args" / "!args").
//
// compose() reports what the Composer should do with the result:
//
//   success                      replace the node, rescan it if it is a container
//   retry                        leave the node, try again on the next pass
//   completed                    replace the node, never rescan it
//   compose_in_separate_context  compose the value as its own document first
// =============================================================================

namespace jcomp {

enum class CompositionStatus
{
    success,
    retry,
    completed,
    compose_in_separate_context,
};

struct CompositionResult {
    CompositionStatus status = CompositionStatus::retry;
    json              value;
};

/** Settings shared by every handler of one Composer (and of its nested runs). */
struct CompositionOptions {
    GeneratorRegistry*     generators = nullptr;
    const MatcherRegistry* matchers   = nullptr;
    std::filesystem::path  base_dir;
    bool                   use_cache  = false;
    std::size_t            max_passes = 1000;
};

/** What a handler may see of the Composer that owns it. */
struct CompositionContext {
    ContentWrapper&                        content;
    const CompositionOptions&              options;
    std::function<bool(const json& node)>  is_directive;
};

class CompositionHandler {
public:
    explicit CompositionHandler(const CompositionContext& context) : context_(context) {}
    virtual ~CompositionHandler() = default;

    CompositionHandler(const CompositionHandler&) = delete;
    CompositionHandler& operator=(const CompositionHandler&) = delete;

    /** Marker key, e.g. "!ref". */
    virtual const char* definition_key() const noexcept = 0;

    virtual bool match(const json& node) const {
        return node.is_object() && node.contains(definition_key());
    }

    /** `at` is the pointer of the directive being composed. */
    virtual CompositionResult compose(const json& node, const Pointer& at) = 0;

protected:
    const CompositionContext& context_;

    /** Modifier `name` spelled "$name" or "!name", or nullptr. */
    static const json* modifier(const json& node, const std::string& name) {
        auto it = node.find("$" + name);
        if (it != node.end()) return &*it;
        it = node.find("!" + name);
        if (it != node.end()) return &*it;
        return nullptr;
    }

    static bool is_modifier(const std::string& key, const std::string& name) {
        return key.size() == name.size() + 1 && (key[0] == '$' || key[0] == '!')
            && key.compare(1, std::string::npos, name) == 0;
    }

    std::string string_payload(const json& node) const {
        const json& payload = node.at(definition_key());
        if (!payload.is_string()) {
            throw SyntaxError("Value of \"" + std::string(definition_key())
                              + "\" must be a string, got " + payload.dump() + ".");
        }
        return payload.get<std::string>();
    }

    std::filesystem::path resolve_path(const std::string& raw) const {
        std::filesystem::path path(raw);
        if (path.is_relative() && !context_.options.base_dir.empty()) {
            path = context_.options.base_dir / path;
        }
        return std::filesystem::absolute(path).lexically_normal();
    }
};

// ---------------------------------------------------------------------------
// References
// ---------------------------------------------------------------------------

class ReferenceCompositionHandler : public CompositionHandler {
public:
    using CompositionHandler::CompositionHandler;

    const char* definition_key() const noexcept override { return "!ref"; }

    CompositionResult compose(const json& node, const Pointer& at) override {
        const Pointer target = target_of(node);
        check_not_self(target, at);

        if (!context_.content.has(target)) {
            return { CompositionStatus::retry, json() };
        }
        const json& value = context_.content.get(target);
        if (context_.is_directive(value)) {
            follow_chain(at, target);
            return { CompositionStatus::retry, json() };
        }
        return { CompositionStatus::success, value };
    }

protected:
    Pointer target_of(const json& node) const {
        const std::string raw = string_payload(node);
        Pointer target = Pointer::parse(raw);
        if (!target.is_plain()) {
            throw SyntaxError("Reference \"" + raw + "\" must be a plain JSON Pointer.");
        }
        if (target.is_root()) {
            throw InvalidOperationError("Referencing to document root is not allowed!");
        }
        return target;
    }

    static void check_not_self(const Pointer& target, const Pointer& at) {
        if (target == at || target.is_parent_of(at)) {
            throw CycleError("Reference at \"" + at.rfc() + "\" points to \"" + target.rfc()
                             + "\" which contains the reference itself.");
        }
    }

    /**
     * The target is an unresolved directive.  Walk the chain of references
     * it starts and fail if the chain comes back to a pointer already seen.
     */
    void follow_chain(const Pointer& at, const Pointer& target) const {
        std::vector<Pointer> chain{ at, target };
        Pointer current = target;
        while (true) {
            const json& value = context_.content.get(current);
            const json* payload = nullptr;
            if (value.is_object()) {
                auto it = value.find("!ref");
                if (it == value.end()) it = value.find("!xref");
                if (it != value.end()) payload = &*it;
            }
            if (!payload || !payload->is_string()) return;
            const std::string& raw = payload->get_ref<const std::string&>();
            if (raw.empty() || !Pointer::match(raw)) return;
            Pointer next = Pointer::parse(raw);
            for (const auto& seen : chain) {
                if (seen == next || next.is_parent_of(seen)) {
                    chain.push_back(next);
                    throw CycleError("Cyclic reference detected: " + describe(chain) + ".");
                }
            }
            if (!context_.content.has(next)) return;
            chain.push_back(next);
            current = next;
        }
    }

    static std::string describe(const std::vector<Pointer>& chain) {
        std::string out;
        for (const auto& ptr : chain) {
            if (!out.empty()) out += " -> ";
            out += "\"" + ptr.rfc() + "\"";
        }
        return out;
    }
};

/**
 * Reference whose object target may be adjusted before use:
 *
 *   "$extend"     {sub-pointer: value}, add or overwrite inside the copy
 *   "$delete"     [sub-pointer, ...], removed from the copy
 *   "$ifPresent"  [sub-pointer, ...] that must exist in the target
 *   "$ifMissing"  [sub-pointer, ...] that must not exist in the target
 *
 * Unsatisfied conditions leave the directive for a later pass.
 */
class ExtendedReferenceCompositionHandler : public ReferenceCompositionHandler {
public:
    using ReferenceCompositionHandler::ReferenceCompositionHandler;

    const char* definition_key() const noexcept override { return "!xref"; }

    CompositionResult compose(const json& node, const Pointer& at) override {
        const Pointer target = target_of(node);
        check_not_self(target, at);

        if (!context_.content.has(target)) {
            return { CompositionStatus::retry, json() };
        }
        const json& value = context_.content.get(target);
        if (context_.is_directive(value)) {
            follow_chain(at, target);
            return { CompositionStatus::retry, json() };
        }

        const json* extend     = modifier(node, "extend");
        const json* remove     = modifier(node, "delete");
        const json* if_present = modifier(node, "ifPresent");
        const json* if_missing = modifier(node, "ifMissing");

        if (!extend && !remove && !if_present && !if_missing) {
            return { CompositionStatus::success, value };
        }
        if (!value.is_object()) {
            throw InvalidOperationError("Extended reference to \"" + target.rfc()
                                        + "\" can only modify an object, got "
                                        + std::string(value.type_name()) + ".");
        }

        auto copy = context_.content.spawn(value);
        if (if_present) {
            for (const auto& ptr : pointer_list(*if_present, "ifPresent")) {
                if (!copy->has(ptr)) return { CompositionStatus::retry, json() };
            }
        }
        if (if_missing) {
            for (const auto& ptr : pointer_list(*if_missing, "ifMissing")) {
                if (copy->has(ptr)) return { CompositionStatus::retry, json() };
            }
        }
        if (extend) {
            if (!extend->is_object()) {
                throw InvalidOperationError("\"$extend\" must be an object of pointer/value pairs.");
            }
            for (const auto& item : extend->items()) {
                copy->update(item.key(), item.value());
            }
        }
        if (remove) {
            for (const auto& ptr : pointer_list(*remove, "delete")) {
                copy->remove(ptr);
            }
        }
        return { CompositionStatus::success, copy->document() };
    }

private:
    static std::vector<std::string> pointer_list(const json& value, const char* name) {
        if (value.is_string()) return { value.get<std::string>() };
        if (!value.is_array()) {
            throw InvalidOperationError(std::string("\"$") + name + "\" must be a pointer or a list of pointers.");
        }
        std::vector<std::string> out;
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw InvalidOperationError(std::string("\"$") + name + "\" contains a non-string pointer "
                                            + item.dump() + ".");
            }
            out.push_back(item.get<std::string>());
        }
        return out;
    }
};

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

class FileReferenceCompositionHandler : public CompositionHandler {
public:
    using CompositionHandler::CompositionHandler;

    const char* definition_key() const noexcept override { return "!file"; }

    CompositionResult compose(const json& node, const Pointer&) override {
        const std::filesystem::path path = resolve_path(string_payload(node));
        return { CompositionStatus::success, load(path) };
    }

    void invalidate_cache() { cache_.clear(); }

private:
    std::map<std::string, json> cache_;

    json load(const std::filesystem::path& path) {
        if (context_.options.use_cache) {
            auto it = cache_.find(path.string());
            if (it != cache_.end()) return it->second;
        }
        json content = DataReader::read_json_file(path);
        JCOMP_INFO("Loaded file reference \"{}\"", path.string());
        if (context_.options.use_cache) {
            cache_[path.string()] = content;
        }
        return content;
    }
};

class IncludeFileCompositionHandler : public CompositionHandler {
public:
    using CompositionHandler::CompositionHandler;

    const char* definition_key() const noexcept override { return "!include"; }

    CompositionResult compose(const json& node, const Pointer&) override {
        const std::filesystem::path path = resolve_path(string_payload(node));

        std::string format;
        if (const json* f = modifier(node, "format")) {
            if (!f->is_string()) {
                throw InvalidOperationError("\"$format\" must be a string, got " + f->dump() + ".");
            }
            format = f->get<std::string>();
        }
        bool separate = false;
        if (const json* c = modifier(node, "compose")) {
            if (!c->is_boolean()) {
                throw InvalidOperationError("\"$compose\" must be a boolean, got " + c->dump() + ".");
            }
            separate = c->get<bool>();
        }

        const std::string key = path.string() + "|" + format;
        json content;
        auto it = cache_.find(key);
        if (context_.options.use_cache && it != cache_.end()) {
            content = it->second;
        } else {
            content = DataReader::read_file(path, format);
            JCOMP_INFO("Included file \"{}\"", path.string());
            if (context_.options.use_cache) cache_[key] = content;
        }

        return { separate ? CompositionStatus::compose_in_separate_context : CompositionStatus::completed,
                 std::move(content) };
    }

private:
    std::map<std::string, json> cache_;
};

// ---------------------------------------------------------------------------
// Generated values and matchers
// ---------------------------------------------------------------------------

class GeneratorCompositionHandler : public CompositionHandler {
public:
    using CompositionHandler::CompositionHandler;

    const char* definition_key() const noexcept override { return "!gen"; }

    CompositionResult compose(const json& node, const Pointer&) override {
        if (!context_.options.generators) {
            throw InvalidOperationError("No generator registry is configured for composition.");
        }
        const std::string name = string_payload(node);

        const json* args_value = modifier(node, "args");
        const json  args       = args_value ? *args_value : json::array();

        std::optional<std::string> correlation_id;
        if (const json* id = modifier(node, "id")) {
            correlation_id = id->is_string() ? id->get<std::string>() : id->dump();
        }

        json kwargs = json::object();
        for (const auto& item : node.items()) {
            if (item.key() == definition_key() || is_modifier(item.key(), "args")
                || is_modifier(item.key(), "id")) {
                continue;
            }
            kwargs[item.key()] = item.value();
        }

        return { CompositionStatus::success,
                 context_.options.generators->generate(name, args, kwargs, correlation_id) };
    }
};

/** Replaces the directive with a matcher descriptor (see MatcherRegistry). */
class MatcherCompositionHandler : public CompositionHandler {
public:
    using CompositionHandler::CompositionHandler;

    const char* definition_key() const noexcept override { return "!match"; }

    CompositionResult compose(const json& node, const Pointer&) override {
        if (!context_.options.matchers) {
            throw InvalidOperationError("No matcher registry is configured for composition.");
        }
        const std::string name = string_payload(node);

        const json* args_value = modifier(node, "args");
        const json  args       = args_value ? *args_value : json::array();

        json kwargs = json::object();
        for (const auto& item : node.items()) {
            if (item.key() == definition_key() || is_modifier(item.key(), "args")) continue;
            kwargs[item.key()] = item.value();
        }

        // Built once to validate the arguments.
        context_.options.matchers->construct(name, args, kwargs);
        return { CompositionStatus::success, MatcherRegistry::descriptor(name, args, kwargs) };
    }
};

// ---------------------------------------------------------------------------
// HandlerRegistry
// ---------------------------------------------------------------------------

/**
 * Ordered list of handler factories.  A Composer instantiates one handler
 * per factory for its own content; the first handler whose match() accepts
 * a node wins.
 */
class HandlerRegistry {
public:
    using Factory = std::function<std::unique_ptr<CompositionHandler>(const CompositionContext&)>;

    /** Reference, extended reference, file, include, generator and matcher handlers. */
    static HandlerRegistry defaults() {
        HandlerRegistry registry;
        registry.add<ReferenceCompositionHandler>()
                .add<ExtendedReferenceCompositionHandler>()
                .add<FileReferenceCompositionHandler>()
                .add<IncludeFileCompositionHandler>()
                .add<GeneratorCompositionHandler>()
                .add<MatcherCompositionHandler>();
        return registry;
    }

    template<typename Handler>
    HandlerRegistry& add() {
        return add([](const CompositionContext& context) -> std::unique_ptr<CompositionHandler> {
            return std::make_unique<Handler>(context);
        });
    }

    HandlerRegistry& add(Factory factory) {
        factories_.push_back(std::move(factory));
        return *this;
    }

    std::size_t size() const noexcept { return factories_.size(); }
    bool empty() const noexcept { return factories_.empty(); }

    std::vector<std::unique_ptr<CompositionHandler>> instantiate(const CompositionContext& context) const {
        std::vector<std::unique_ptr<CompositionHandler>> handlers;
        handlers.reserve(factories_.size());
        for (const auto& factory : factories_) {
            handlers.push_back(factory(context));
        }
        return handlers;
    }

private:
    std::vector<Factory> factories_;
};

} // namespace jcomp
