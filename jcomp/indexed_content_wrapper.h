#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "content_wrapper.h"

// =============================================================================
// jcomp::IndexedContentWrapper
//
// ContentWrapper backed by a flat node map: every live node of the document
// (containers and scalars alike) is registered under its Pointer together
// with the location that holds it:
//
//   "/a"      -> (object_t* of root, key "a")
//   "/a/0"    -> (array_t*  of /a,   index 0)
//   "/a/0/b"  -> (object_t* of /a/0, key "b")
//
// Locations refer to the heap storage of the parent container (object_t or
// array_t), which nlohmann::ordered_json keeps at a stable address while the
// container itself lives, so sibling insertions never invalidate entries.
//
// get()/has() are a single map lookup.  update()/remove() patch only the
// affected subtree:
//   - writing a container registers all of its descendants;
//   - replacing a container prunes every entry below it first;
//   - removing an array element re-indexes that array's subtree.
//
// Edits made to the document behind the wrapper's back leave the map stale
// until recalculate() is called.
// =============================================================================

namespace jcomp {

class IndexedContentWrapper : public ContentWrapper {
public:
    explicit IndexedContentWrapper(json content = json::object())
        : content_(std::move(content))
    {
        require_container(content_);
        recalculate();
    }

    // Copies must index their own document.
    IndexedContentWrapper(const IndexedContentWrapper& other)
        : content_(other.content_)
    {
        recalculate();
    }

    IndexedContentWrapper(IndexedContentWrapper&&) = default;
    IndexedContentWrapper& operator=(const IndexedContentWrapper&) = delete;
    IndexedContentWrapper& operator=(IndexedContentWrapper&&) = default;

    const json& document() const noexcept override { return content_; }
    const char* kind() const noexcept override { return "indexed"; }

    std::unique_ptr<ContentWrapper> spawn(json content) const override {
        return std::make_unique<IndexedContentWrapper>(std::move(content));
    }

    /** Rebuild the node map from scratch. */
    void recalculate() {
        nodes_.clear();
        scan(content_, Pointer{});
    }

    /**
     * Direct mutable access to the document for callers that edit it in
     * bulk.  recalculate() must be called afterwards.
     */
    json& unsafe_document() noexcept { return content_; }

    /** Number of registered nodes (root excluded). */
    std::size_t node_count() const noexcept { return nodes_.size(); }

protected:
    const json& do_get(const Pointer& ptr) const override {
        if (ptr.is_root()) return content_;

        auto it = nodes_.find(ptr);
        if (it == nodes_.end()) {
            throw miss_error(ptr);
        }
        return it->second.resolve();
    }

    bool do_has(const Pointer& ptr) const noexcept override {
        return ptr.is_root() || nodes_.count(ptr) != 0;
    }

    void do_update(const Pointer& ptr, json value) override {
        auto it = nodes_.find(ptr);
        if (it != nodes_.end()) {
            json& target = it->second.resolve();
            if (target.is_structured()) {
                prune(ptr);
            }
            target = std::move(value);
            if (target.is_structured()) {
                scan(target, ptr.as_plain());
            }
            return;
        }

        // New key or append: the parent must already be registered.
        const Pointer parent_ptr = ptr.parent();
        json& parent = mutable_node(parent_ptr, ptr);
        const std::string& key = ptr.back();

        if (parent.is_array()) {
            if (key != Pointer::APPEND_SEGMENT) {
                throw lookup_error(parent, ptr, ptr.size() - 1, true);
            }
            auto* array = parent.get_ptr<json::array_t*>();
            array->push_back(std::move(value));
            const std::size_t index = array->size() - 1;
            const Pointer at = parent_ptr.child(index);
            nodes_[at] = Location{ nullptr, array, std::string{}, index };
            if (array->back().is_structured()) {
                scan(array->back(), at);
            }
            return;
        }

        if (parent.is_object()) {
            auto* object = parent.get_ptr<json::object_t*>();
            json& slot = (*object)[key];
            slot = std::move(value);
            const Pointer at = ptr.as_plain();
            nodes_[at] = Location{ object, nullptr, key, 0 };
            if (slot.is_structured()) {
                scan(slot, at);
            }
            return;
        }

        throw lookup_error(parent, ptr, ptr.size() - 1, true);
    }

    bool do_remove(const Pointer& ptr) override {
        if (ptr.is_root()) {
            content_.clear();
            nodes_.clear();
            return true;
        }

        auto it = nodes_.find(ptr);
        if (it == nodes_.end()) return false;

        const Location location = it->second;
        if (location.array) {
            // Later elements shift down: re-index the whole array subtree.
            location.array->erase(location.array->begin()
                                  + static_cast<std::ptrdiff_t>(location.index));
            const Pointer parent_ptr = ptr.parent();
            prune(parent_ptr);
            scan(parent_ptr.is_root() ? content_ : nodes_.at(parent_ptr).resolve(), parent_ptr);
            return true;
        }

        prune(ptr);
        nodes_.erase(it);
        location.object->erase(location.key);
        return true;
    }

private:
    struct Location {
        json::object_t* object = nullptr;   // set for object members
        json::array_t*  array  = nullptr;   // set for array elements
        std::string     key;
        std::size_t     index  = 0;

        json& resolve() const {
            return object ? object->at(key) : (*array)[index];
        }
    };

    json                                  content_;
    std::unordered_map<Pointer, Location> nodes_;

    /** Register every descendant of `node`, which lives at `at`. */
    void scan(json& node, const Pointer& at) {
        if (node.is_object()) {
            auto* object = node.get_ptr<json::object_t*>();
            for (auto& [key, value] : *object) {
                const Pointer child = at.child(key);
                nodes_[child] = Location{ object, nullptr, key, 0 };
                if (value.is_structured()) scan(value, child);
            }
        } else if (node.is_array()) {
            auto* array = node.get_ptr<json::array_t*>();
            for (std::size_t i = 0; i < array->size(); ++i) {
                const Pointer child = at.child(i);
                nodes_[child] = Location{ nullptr, array, std::string{}, i };
                if ((*array)[i].is_structured()) scan((*array)[i], child);
            }
        }
    }

    /** Drop every entry strictly below `at`. */
    void prune(const Pointer& at) {
        if (at.is_root()) {
            nodes_.clear();
            return;
        }
        for (auto it = nodes_.begin(); it != nodes_.end();) {
            if (it->first.is_child_of(at)) it = nodes_.erase(it);
            else ++it;
        }
    }

    json& mutable_node(const Pointer& at, const Pointer& requested) {
        if (at.is_root()) return content_;
        auto it = nodes_.find(at);
        if (it == nodes_.end()) {
            throw miss_error(requested);
        }
        return it->second.resolve();
    }

    /**
     * Explain a map miss: walk the document to name the failing segment, or
     * point at a stale map when the document does contain the node.
     */
    NotFoundError miss_error(const Pointer& ptr) const {
        const json* stuck = nullptr;
        std::size_t depth = 0;
        if (locate(content_, ptr, &stuck, &depth)) {
            return NotFoundError(
                "Failed to find value by \"" + ptr.rfc() + "\" JSON Pointer in the node map. "
                "Document content was modified directly (consider calling "
                "recalculate() to restore integrity).");
        }
        return lookup_error(*stuck, ptr, depth);
    }
};

} // namespace jcomp
