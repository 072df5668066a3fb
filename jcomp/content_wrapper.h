#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "json.h"
#include "pointer.h"

// =============================================================================
// jcomp::ContentWrapper
//
// Pointer-addressed access to one JSON document owned by the wrapper.
//
// Public operations are non-virtual and accept either a Pointer or its raw
// string form; implementations provide the protected do_*() hooks:
//
//   get(ptr)                 value at ptr, NotFoundError if absent
//   has(ptr)                 never throws
//   get_or_default(ptr, d)   copy of the value or of d
//   update(ptr, value)       replace / add key / append with "-"
//   remove(ptr)              false if absent, root clears the document
//   iterate()                lazy range of (Pointer, scalar) leaves
//
// The document root is always an object or an array.  Array indices are
// decimal digits without leading zeros; negative indices are not accepted.
// =============================================================================

namespace jcomp {


/**
 * Forward iterator over the scalar leaves of a document, in document order.
 * Empty objects and arrays produce no leaves.  Any mutation of the document
 * invalidates live iterators.
 */
class LeafIterator {
public:
    using value_type        = std::pair<Pointer, json>;
    using reference         = const value_type&;
    using pointer           = const value_type*;
    using difference_type   = std::ptrdiff_t;
    using iterator_category = std::input_iterator_tag;

    /** End iterator. */
    LeafIterator() = default;

    explicit LeafIterator(const json& root) {
        if (root.is_structured() && !root.empty()) {
            stack_.push_back(Frame{ &root, Pointer{}, root.cbegin(), 0 });
        }
        advance();
    }

    reference operator*()  const { return current_; }
    pointer   operator->() const { return &current_; }

    LeafIterator& operator++() {
        advance();
        return *this;
    }

    bool operator==(const LeafIterator& other) const {
        if (at_end_ || other.at_end_) return at_end_ == other.at_end_;
        return current_.first == other.current_.first;
    }

    bool operator!=(const LeafIterator& other) const { return !(*this == other); }

private:
    struct Frame {
        const json*          node;
        Pointer              at;
        json::const_iterator it;
        std::size_t          index;
    };

    std::vector<Frame> stack_;
    value_type         current_;
    bool               at_end_ = true;

    void advance() {
        while (!stack_.empty()) {
            Frame& frame = stack_.back();
            if (frame.it == frame.node->cend()) {
                stack_.pop_back();
                continue;
            }
            Pointer at = frame.node->is_array() ? frame.at.child(frame.index)
                                                : frame.at.child(frame.it.key());
            const json& value = *frame.it;
            ++frame.it;
            ++frame.index;

            if (value.is_structured()) {
                if (!value.empty()) {
                    stack_.push_back(Frame{ &value, std::move(at), value.cbegin(), 0 });
                }
                continue;
            }
            current_ = value_type{ std::move(at), value };
            at_end_  = false;
            return;
        }
        at_end_ = true;
    }
};

/** Restartable range: each begin() starts a fresh walk. */
class LeafRange {
public:
    explicit LeafRange(const json& document) : document_(&document) {}

    LeafIterator begin() const { return LeafIterator(*document_); }
    LeafIterator end()   const { return LeafIterator{}; }

private:
    const json* document_;
};

class ContentWrapper {
public:
    virtual ~ContentWrapper() = default;

    // ---- read ----

    const json& get(const Pointer& ptr) const { return do_get(address(ptr)); }
    const json& get(const std::string& raw) const { return do_get(address(raw)); }

    bool has(const Pointer& ptr) const noexcept {
        if (ptr.is_file()) return false;
        return do_has(ptr);
    }

    /** False for strings that are not valid pointers. */
    bool has(const std::string& raw) const noexcept {
        if (!Pointer::match(raw) && !Pointer::match_reference(raw)) return false;
        try {
            return do_has(Pointer::parse(raw));
        } catch (const Error&) {
            return false;
        }
    }

    json get_or_default(const Pointer& ptr, json default_value) const {
        return has(ptr) ? get(ptr) : std::move(default_value);
    }

    json get_or_default(const std::string& raw, json default_value) const {
        return get_or_default(address(raw), std::move(default_value));
    }

    LeafRange iterate() const { return LeafRange(document()); }

    // ---- write ----

    void update(const Pointer& ptr, json value) {
        const Pointer& at = address(ptr);
        if (at.is_root()) {
            throw InvalidOperationError(
                "Direct root modifications is not allowed! "
                "Specified pointer is required to add/update keys!");
        }
        do_update(at, std::move(value));
    }

    void update(const std::string& raw, json value) { update(address(raw), std::move(value)); }

    bool remove(const Pointer& ptr) { return do_remove(address(ptr)); }
    bool remove(const std::string& raw) { return do_remove(address(raw)); }

    // ---- whole document ----

    virtual const json& document() const noexcept = 0;

    /** Short implementation name ("direct", "indexed"). */
    virtual const char* kind() const noexcept = 0;

    /** Fresh wrapper of the same kind around `content`. */
    virtual std::unique_ptr<ContentWrapper> spawn(json content) const = 0;

    bool operator==(const json& other) const { return document() == other; }
    bool operator==(const ContentWrapper& other) const { return document() == other.document(); }
    bool operator!=(const json& other) const { return !(*this == other); }

    // ---- helpers shared by implementations ----

    /** Array index: decimal digits, no sign, no leading zeros. */
    static std::optional<std::size_t> parse_index(const std::string& segment) noexcept {
        if (segment.empty() || segment.size() > 18) return std::nullopt;
        if (segment.size() > 1 && segment.front() == '0') return std::nullopt;
        std::size_t value = 0;
        for (char c : segment) {
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + static_cast<std::size_t>(c - '0');
        }
        return value;
    }

protected:
    virtual const json& do_get(const Pointer& ptr) const = 0;
    virtual bool do_has(const Pointer& ptr) const noexcept = 0;
    virtual void do_update(const Pointer& ptr, json value) = 0;
    virtual bool do_remove(const Pointer& ptr) = 0;

    static void require_container(const json& content) {
        if (!content.is_structured()) {
            throw InvalidOperationError(
                std::string("Content must be a JSON object or array, got ") + content.type_name() + ".");
        }
    }

    /** Child of `node` addressed by `segment`, or nullptr. */
    template<typename J>
    static J* child_of(J& node, const std::string& segment) {
        if (node.is_object()) {
            auto it = node.find(segment);
            return it == node.end() ? nullptr : &*it;
        }
        if (node.is_array()) {
            auto index = parse_index(segment);
            if (!index || *index >= node.size()) return nullptr;
            return &node[*index];
        }
        return nullptr;
    }

    /**
     * Walk `ptr` from `root`.  On a miss returns nullptr and reports the last
     * node reached and the depth of the failing segment.
     */
    template<typename J>
    static J* locate(J& root, const Pointer& ptr, J** stuck = nullptr, std::size_t* depth = nullptr) {
        J* node = &root;
        const auto& path = ptr.path();
        for (std::size_t i = 0; i < path.size(); ++i) {
            J* next = child_of(*node, path[i]);
            if (!next) {
                if (stuck) *stuck = node;
                if (depth) *depth = i;
                return nullptr;
            }
            node = next;
        }
        return node;
    }

    /** Describe why segment `depth` of `ptr` cannot be resolved inside `node`. */
    static NotFoundError lookup_error(const json& node, const Pointer& ptr, std::size_t depth,
                                      bool for_update = false) {
        const std::string& key = ptr.path()[depth];
        std::string node_path = Pointer::from_path(
            std::vector<std::string>(ptr.path().begin(), ptr.path().begin() + depth)).rfc();
        if (node_path.empty()) node_path = "<root>";
        const std::string where = "node \"" + node_path + "\" of pointer \"" + ptr.rfc() + "\".";

        if (node.is_object()) {
            return NotFoundError("Key \"" + key + "\" is not present in " + where);
        }
        if (node.is_array()) {
            const std::string hint = for_update
                ? " Index must be an integer in array's range (to update element at specific index) "
                  "or \"-\" (to append new element)."
                : " Index must be a non-negative integer in array's range.";
            if (!parse_index(key)) {
                return NotFoundError("Invalid array index \"" + key + "\" at " + where + hint);
            }
            return NotFoundError("Index \"" + key + "\" is out of range for " + where + hint);
        }
        return NotFoundError("Path node \"" + node_path + "\" at pointer \"" + ptr.rfc()
                             + "\" is not an object or array.");
    }

private:
    static const Pointer& address(const Pointer& ptr) {
        if (ptr.is_file()) {
            throw SyntaxError("File pointer \"" + ptr.to_string() + "\" cannot address a document node.");
        }
        return ptr;
    }

    static Pointer address(const std::string& raw) {
        Pointer ptr = Pointer::parse(raw);
        address(ptr);
        return ptr;
    }
};

} // namespace jcomp
