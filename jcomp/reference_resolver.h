#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "content_wrapper.h"
#include "data_reader.h"
#include "errors.h"
#include "logging.h"
#include "pointer.h"

namespace jcomp {

/**
 * Resolves string directives in one pass:
 *
 *   "!ref /a/b"        value at /a/b of the same document
 *   "!file data.json"  parsed file content
 *
 * Targets are resolved before they are substituted, so chains of references
 * and references inside included files work.  References found inside a
 * file point into the including document.
 *
 * Results are memoized by canonical directive ("!ref /a/b", "!file <absolute
 * path>") when caching is enabled.  A directive met again while it is still
 * being resolved raises CycleError listing the chain.
 */
class ReferenceResolver {
public:
    explicit ReferenceResolver(ContentWrapper& content,
                               std::filesystem::path base_dir = {},
                               bool enable_cache = true)
        : content_(content)
        , base_dir_(std::move(base_dir))
        , enable_cache_(enable_cache)
    {
    }

    /** Replace every directive string in the document. */
    void resolve_all() {
        visit(Pointer{});
    }

    /** Resolved copy of `value`, which is taken as located at `at`. */
    json resolve(const json& value, const Pointer& at = Pointer{}) {
        return resolve_value(value, at);
    }

    static bool is_directive(const json& value) {
        if (!value.is_string()) return false;
        const auto& raw = value.get_ref<const std::string&>();
        return Pointer::match_reference(raw) || Pointer::match_file(raw);
    }

    void invalidate_cache() { cache_.clear(); }

    std::size_t cache_size() const noexcept { return cache_.size(); }

private:
    struct Frame {
        std::string directive;
        Pointer     at;
    };

    ContentWrapper&             content_;
    std::filesystem::path       base_dir_;
    bool                        enable_cache_;
    std::map<std::string, json> cache_;
    std::vector<Frame>          visiting_;

    void visit(const Pointer& at) {
        const json& node = content_.get(at);
        if (is_directive(node)) {
            json value = resolve_directive(node.get<std::string>(), at);
            content_.update(at, std::move(value));
            return;
        }
        if (node.is_object()) {
            std::vector<std::string> keys;
            for (const auto& item : node.items()) keys.push_back(item.key());
            for (const auto& key : keys) visit(at.child(key));
        } else if (node.is_array()) {
            const std::size_t size = node.size();
            for (std::size_t i = 0; i < size; ++i) visit(at.child(i));
        }
    }

    json resolve_value(const json& value, const Pointer& at) {
        if (is_directive(value)) {
            return resolve_directive(value.get<std::string>(), at);
        }
        if (value.is_object()) {
            json out = json::object();
            for (const auto& item : value.items()) {
                out[item.key()] = resolve_value(item.value(), at.child(item.key()));
            }
            return out;
        }
        if (value.is_array()) {
            json out = json::array();
            for (std::size_t i = 0; i < value.size(); ++i) {
                out.push_back(resolve_value(value[i], at.child(i)));
            }
            return out;
        }
        return value;
    }

    json resolve_directive(const std::string& raw, const Pointer& at) {
        const Pointer directive = Pointer::parse(raw);
        const std::string key = directive.is_file()
            ? std::string(Pointer::FILE_PREFIX) + file_path(directive).string()
            : directive.to_string();

        if (enable_cache_) {
            auto it = cache_.find(key);
            if (it != cache_.end()) return it->second;
        }

        for (const auto& frame : visiting_) {
            if (frame.directive == key) {
                throw CycleError("Cyclic reference detected while resolving \"" + raw + "\":\n"
                                 + describe_chain(key, at));
            }
        }

        visiting_.push_back(Frame{ key, at });
        json value;
        try {
            value = directive.is_file() ? load_file(directive) : lookup(directive, at);
        } catch (...) {
            visiting_.pop_back();
            throw;
        }
        visiting_.pop_back();

        if (enable_cache_) cache_[key] = value;
        return value;
    }

    json lookup(const Pointer& target, const Pointer& at) {
        if (!content_.has(target)) {
            throw ResolutionError("Failed to resolve reference \"" + target.to_string() + "\" at \""
                                  + at.rfc() + "\": target node is not present in the document.\n"
                                  + "Resolution path:\n" + describe_path());
        }
        return resolve_value(content_.get(target), target.as_plain());
    }

    json load_file(const Pointer& directive) {
        const std::filesystem::path path = file_path(directive);
        JCOMP_INFO("Resolving file reference \"{}\"", path.string());
        return resolve_value(DataReader::read_json_file(path), Pointer{});
    }

    std::filesystem::path file_path(const Pointer& directive) const {
        std::filesystem::path path(directive.file_path());
        if (path.is_relative() && !base_dir_.empty()) path = base_dir_ / path;
        return std::filesystem::absolute(path).lexically_normal();
    }

    std::string describe_path() const {
        std::string out;
        for (const auto& frame : visiting_) {
            out += "  at \"" + frame.at.rfc() + "\" -> " + frame.directive + "\n";
        }
        return out;
    }

    std::string describe_chain(const std::string& repeated, const Pointer& at) const {
        return describe_path() + "  at \"" + at.rfc() + "\" -> " + repeated + " (repeated)";
    }
};

} // namespace jcomp
