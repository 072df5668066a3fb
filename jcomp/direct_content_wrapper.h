#pragma once

#include <memory>
#include <string>

#include "content_wrapper.h"

namespace jcomp {

/**
 * ContentWrapper that walks the document from the root on every call.
 *
 * Nothing is cached, so the wrapper stays correct no matter how the
 * document is edited; each operation costs O(depth).
 */
class DirectContentWrapper : public ContentWrapper {
public:
    explicit DirectContentWrapper(json content = json::object())
        : content_(std::move(content))
    {
        require_container(content_);
    }

    const json& document() const noexcept override { return content_; }
    const char* kind() const noexcept override { return "direct"; }

    std::unique_ptr<ContentWrapper> spawn(json content) const override {
        return std::make_unique<DirectContentWrapper>(std::move(content));
    }

protected:
    const json& do_get(const Pointer& ptr) const override {
        const json* stuck = nullptr;
        std::size_t depth = 0;
        const json* node  = locate(content_, ptr, &stuck, &depth);
        if (!node) {
            throw lookup_error(*stuck, ptr, depth);
        }
        return *node;
    }

    bool do_has(const Pointer& ptr) const noexcept override {
        return locate(content_, ptr) != nullptr;
    }

    void do_update(const Pointer& ptr, json value) override {
        json*       stuck  = nullptr;
        std::size_t depth  = 0;
        json*       parent = locate(content_, ptr.parent(), &stuck, &depth);
        if (!parent) {
            throw lookup_error(*stuck, ptr, depth, true);
        }

        const std::string& key = ptr.back();
        if (parent->is_object()) {
            (*parent)[key] = std::move(value);
            return;
        }
        if (parent->is_array()) {
            if (key == Pointer::APPEND_SEGMENT) {
                parent->push_back(std::move(value));
                return;
            }
            auto index = parse_index(key);
            if (!index || *index >= parent->size()) {
                throw lookup_error(*parent, ptr, ptr.size() - 1, true);
            }
            (*parent)[*index] = std::move(value);
            return;
        }
        throw lookup_error(*parent, ptr, ptr.size() - 1, true);
    }

    bool do_remove(const Pointer& ptr) override {
        if (ptr.is_root()) {
            content_.clear();
            return true;
        }

        json* parent = locate(content_, ptr.parent());
        if (!parent) return false;

        const std::string& key = ptr.back();
        if (parent->is_object()) {
            return parent->erase(key) > 0;
        }
        if (parent->is_array()) {
            auto index = parse_index(key);
            if (!index || *index >= parent->size()) return false;
            parent->erase(*index);
            return true;
        }
        return false;
    }

private:
    json content_;
};

} // namespace jcomp
