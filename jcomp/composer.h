#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "composition_handlers.h"
#include "content_wrapper.h"
#include "errors.h"
#include "logging.h"
#include "pointer.h"

// =============================================================================
// jcomp::Composer
//
// Replaces every directive below a start pointer with its value by running
// passes until nothing is left to revisit:
//
//   pass 1   worklist = [start]
//            scan each worklist node, compose directives in place,
//            collect retried / freshly substituted containers
//   pass N   worklist = pointers collected by pass N-1
//
// Composition fails with UnresolvableCompositionError when a pass changes
// nothing and leaves exactly the worklist it started with, or when
// options.max_passes is exceeded.  Handler exceptions are rethrown as
// CompositionError naming the pointer; a CycleError is rethrown as a
// CycleError carrying that pointer.
// =============================================================================

namespace jcomp {

class Composer {
public:
    explicit Composer(ContentWrapper& content,
                      CompositionOptions options = {},
                      HandlerRegistry registry = HandlerRegistry::defaults())
        : content_(content)
        , options_(std::move(options))
        , registry_(std::move(registry))
        , context_{ content_, options_, [this](const json& node) { return find_handler(node) != nullptr; } }
        , handlers_(registry_.instantiate(context_))
    {
    }

    // Handlers keep a reference to context_.
    Composer(const Composer&) = delete;
    Composer& operator=(const Composer&) = delete;

    void compose(const Pointer& start = Pointer{}) {
        std::vector<Pointer> worklist{ start };
        passes_ = 0;

        while (!worklist.empty()) {
            if (++passes_ > options_.max_passes) {
                throw UnresolvableCompositionError(
                    "Content composition did not finish in " + std::to_string(options_.max_passes)
                    + " passes. Still unresolved:\n" + describe(worklist));
            }

            next_.clear();
            changed_ = false;
            for (const auto& ptr : worklist) {
                if (!content_.has(ptr)) continue;
                visit(ptr);
            }
            JCOMP_DEBUG("Composition pass {}: {} node(s) to revisit", passes_, next_.size());

            if (!changed_ && !next_.empty() && next_ == worklist) {
                throw UnresolvableCompositionError(
                    "Unresolved errors occurred during content composition for nodes:\n"
                    + describe(next_)
                    + "Please, ensure that compositions used in given nodes are valid!\n"
                      "Possible problems:\n"
                      "- referencing to non-existent nodes;\n"
                      "- recursion references;\n"
                      "- unresolvable order of referencing, etc.");
            }
            worklist = std::move(next_);
            next_ = {};
        }
    }

    void compose(const std::string& raw) { compose(Pointer::parse(raw)); }

    /** Passes made by the last compose() call. */
    std::size_t passes() const noexcept { return passes_; }

    const CompositionOptions& options() const noexcept { return options_; }

private:
    ContentWrapper&                                  content_;
    CompositionOptions                               options_;
    HandlerRegistry                                  registry_;
    CompositionContext                               context_;
    std::vector<std::unique_ptr<CompositionHandler>> handlers_;

    std::vector<Pointer> next_;
    bool                 changed_ = false;
    std::size_t          passes_  = 0;

    CompositionHandler* find_handler(const json& node) const {
        if (!node.is_object()) return nullptr;
        for (const auto& handler : handlers_) {
            if (handler->match(node)) return handler.get();
        }
        return nullptr;
    }

    void visit(const Pointer& at) {
        const json& node = content_.get(at);

        if (node.is_object()) {
            if (CompositionHandler* handler = find_handler(node)) {
                handle(*handler, at, json(node));
                return;
            }
            std::vector<std::string> keys;
            keys.reserve(node.size());
            for (const auto& item : node.items()) keys.push_back(item.key());
            for (const auto& key : keys) visit(at.child(key));
        } else if (node.is_array()) {
            const std::size_t size = node.size();
            for (std::size_t i = 0; i < size; ++i) visit(at.child(i));
        }
    }

    void handle(CompositionHandler& handler, const Pointer& at, const json& directive) {
        if (at.is_root()) {
            throw InvalidOperationError("Composition " + directive.dump()
                                        + " at document root can't be replaced with a value.");
        }

        CompositionResult result;
        try {
            result = handler.compose(directive, at);
        } catch (const CycleError& err) {
            throw CycleError(at.rfc(), err.what());
        } catch (const std::exception& err) {
            throw CompositionError(at.rfc(), err.what());
        }

        switch (result.status) {
            case CompositionStatus::retry:
                next_.push_back(at);
                return;

            case CompositionStatus::success: {
                const bool rescan = result.value.is_structured();
                content_.update(at, std::move(result.value));
                changed_ = true;
                if (rescan) next_.push_back(at);
                return;
            }

            case CompositionStatus::compose_in_separate_context:
                if (result.value.is_structured()) {
                    auto separate = content_.spawn(std::move(result.value));
                    Composer nested(*separate, options_, registry_);
                    nested.compose();
                    JCOMP_DEBUG("Composed \"{}\" in separate context in {} pass(es)", at.rfc(), nested.passes());
                    result.value = separate->document();
                }
                content_.update(at, std::move(result.value));
                changed_ = true;
                return;

            case CompositionStatus::completed:
                content_.update(at, std::move(result.value));
                changed_ = true;
                return;
        }
    }

    std::string describe(const std::vector<Pointer>& pointers) const {
        std::string out;
        for (const auto& ptr : pointers) {
            out += "- node: \"" + ptr.rfc() + "\", current value: "
                 + (content_.has(ptr) ? content_.get(ptr).dump() : std::string("<missing>")) + "\n";
        }
        return out;
    }
};

} // namespace jcomp
