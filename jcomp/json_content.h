#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "composer.h"
#include "config.h"
#include "content_wrapper.h"
#include "data_reader.h"
#include "direct_content_wrapper.h"
#include "generators.h"
#include "indexed_content_wrapper.h"
#include "logging.h"
#include "matchers.h"
#include "reference_resolver.h"

// =============================================================================
// jcomp::JsonContent
//
// Wrap parsed JSON, resolve its directives, read the result:
//
//   jcomp::GeneratorRegistry generators = jcomp::GeneratorRegistry::with_builtins();
//   jcomp::JsonContent content(doc, config, &generators);
//   content.get("/request/body/name");
//
// The wrapper kind and the resolution mode come from EngineConfig:
//   resolution "compose"     structured directives via Composer
//   resolution "references"  string directives via ReferenceResolver
//   resolution "none"        document kept as is
// =============================================================================

namespace jcomp {

class JsonContent {
public:
    explicit JsonContent(json content,
                         const EngineConfig& config = EngineConfig{},
                         GeneratorRegistry* generators = nullptr,
                         const MatcherRegistry* matchers = nullptr)
        : config_(config)
        , wrapper_(make_wrapper(std::move(content), config.wrapper))
    {
        switch (config_.resolution) {
            case EngineConfig::Resolution::compose: {
                CompositionOptions options;
                options.generators = generators;
                options.matchers   = matchers;
                options.base_dir   = config_.base_dir;
                options.use_cache  = config_.enable_cache;
                options.max_passes = config_.max_passes;
                Composer composer(*wrapper_, options);
                composer.compose();
                JCOMP_DEBUG("Content composed in {} pass(es)", composer.passes());
                break;
            }
            case EngineConfig::Resolution::references:
                resolver_ = std::make_unique<ReferenceResolver>(*wrapper_, config_.base_dir, config_.enable_cache);
                resolver_->resolve_all();
                break;
            case EngineConfig::Resolution::none:
                break;
        }
    }

    /**
     * Read and resolve a JSON file.  When the config names no base_dir,
     * relative file directives resolve against the file's directory.
     */
    static JsonContent from_file(const std::filesystem::path& path,
                                 EngineConfig config = EngineConfig{},
                                 GeneratorRegistry* generators = nullptr,
                                 const MatcherRegistry* matchers = nullptr) {
        if (config.base_dir.empty()) {
            config.base_dir = path.parent_path();
        }
        return JsonContent(DataReader::read_json_file(path), config, generators, matchers);
    }

    // ---- read ----

    const json& get(const std::string& ptr) const { return wrapper_->get(ptr); }

    json get_copy(const std::string& ptr) const { return wrapper_->get(ptr); }

    bool has(const std::string& ptr) const noexcept { return wrapper_->has(ptr); }

    json get_or_default(const std::string& ptr, json default_value) const {
        return wrapper_->get_or_default(ptr, std::move(default_value));
    }

    LeafRange iterate() const { return wrapper_->iterate(); }

    // ---- write ----

    /**
     * Set the node at `ptr`.  In references mode string directives inside
     * `value` are resolved first, against the current content.
     */
    void update(const std::string& ptr, json value) {
        if (resolver_) {
            value = resolver_->resolve(value, Pointer::parse(ptr));
        }
        wrapper_->update(ptr, std::move(value));
    }

    bool remove(const std::string& ptr) { return wrapper_->remove(ptr); }

    /** Remove each pointer in order; missing ones are skipped.  Returns the number removed. */
    std::size_t remove_all(const std::vector<std::string>& pointers) {
        std::size_t removed = 0;
        for (const auto& ptr : pointers) {
            if (wrapper_->remove(ptr)) ++removed;
        }
        return removed;
    }

    /** Drop cached references and files (references mode only). */
    void invalidate_cache() {
        if (resolver_) resolver_->invalidate_cache();
    }

    // ---- whole content ----

    const json& document() const noexcept { return wrapper_->document(); }

    const ContentWrapper& wrapper() const noexcept { return *wrapper_; }

    const EngineConfig& config() const noexcept { return config_; }

    bool operator==(const json& other) const { return *wrapper_ == other; }

private:
    EngineConfig                       config_;
    std::unique_ptr<ContentWrapper>    wrapper_;
    std::unique_ptr<ReferenceResolver> resolver_;

    static std::unique_ptr<ContentWrapper> make_wrapper(json content, EngineConfig::Wrapper kind) {
        if (kind == EngineConfig::Wrapper::direct) {
            return std::make_unique<DirectContentWrapper>(std::move(content));
        }
        return std::make_unique<IndexedContentWrapper>(std::move(content));
    }
};

} // namespace jcomp
