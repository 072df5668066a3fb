#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"

// =============================================================================
// jcomp::Pointer
//
// Immutable address into a JSON document, following RFC 6901 with two
// directive flavours layered on top:
//
//   ""            Plain      whole document (root)
//   "/a/b~1c/0"   Plain      segments "a", "b/c", "0"
//   "!ref /a/b"   Reference  same path as "/a/b"; the root is not allowed
//   "!file x.json" File      raw file path, never pointer-escaped
//
// Segments are stored unescaped ("~1" -> "/", "~0" -> "~").  A Reference
// pointer compares equal to the Plain pointer with the same path, so either
// may be used to address a node.
// =============================================================================

namespace jcomp {

class Pointer {
public:
    enum class Kind { plain, reference, file };

    static constexpr const char* REFERENCE_PREFIX = "!ref ";
    static constexpr const char* FILE_PREFIX      = "!file ";
    static constexpr const char* APPEND_SEGMENT   = "-";

    /** Root pointer (""). */
    Pointer() = default;

    // ---- construction ----

    /**
     * Parse `raw` into a Pointer of the matching kind.
     * Throws SyntaxError if `raw` is neither a plain pointer, a "!ref "
     * pointer with a non-root tail, nor a "!file " pointer with a path.
     */
    static Pointer parse(const std::string& raw) {
        if (starts_with(raw, REFERENCE_PREFIX)) {
            std::string tail = raw.substr(std::char_traits<char>::length(REFERENCE_PREFIX));
            if (!match(tail)) {
                throw SyntaxError("Invalid reference pointer \"" + raw + "\". " + syntax_hint());
            }
            if (tail.empty()) {
                throw SyntaxError("Invalid reference pointer \"" + raw
                                  + "\". Referencing the entire document is not allowed.");
            }
            Pointer p = parse_plain(tail);
            p.kind_ = Kind::reference;
            return p;
        }

        if (starts_with(raw, FILE_PREFIX)) {
            std::string file = raw.substr(std::char_traits<char>::length(FILE_PREFIX));
            if (file.empty()) {
                throw SyntaxError("Invalid file pointer \"" + raw + "\". File path must not be empty.");
            }
            Pointer p;
            p.kind_ = Kind::file;
            p.file_ = std::move(file);
            return p;
        }

        if (!match(raw)) {
            throw SyntaxError("Invalid JSON Pointer syntax \"" + raw + "\". " + syntax_hint());
        }
        return parse_plain(raw);
    }

    /** Build a Plain pointer from unescaped segments.  Empty input gives the root. */
    static Pointer from_path(const std::vector<std::string>& segments) {
        Pointer p;
        if (!segments.empty()) {
            p.path_ = segments;
        }
        return p;
    }

    // ---- syntax predicates (never throw) ----

    /** True if `raw` has plain pointer syntax: empty or starting with '/'. */
    static bool match(const std::string& raw) noexcept {
        return raw.empty() || raw.front() == '/';
    }

    /** True if `raw` is a well-formed "!ref /..." string. */
    static bool match_reference(const std::string& raw) noexcept {
        if (!starts_with(raw, REFERENCE_PREFIX)) return false;
        const std::size_t n = std::char_traits<char>::length(REFERENCE_PREFIX);
        return raw.size() > n && raw[n] == '/';
    }

    /** True if `raw` is a well-formed "!file <path>" string. */
    static bool match_file(const std::string& raw) noexcept {
        return starts_with(raw, FILE_PREFIX)
            && raw.size() > std::char_traits<char>::length(FILE_PREFIX);
    }

    // ---- escaping ----

    static std::string escape(const std::string& segment) {
        std::string out;
        out.reserve(segment.size());
        for (char c : segment) {
            if (c == '~')      out += "~0";
            else if (c == '/') out += "~1";
            else               out += c;
        }
        return out;
    }

    // Malformed escapes ("~2", trailing "~") are kept as is.
    static std::string unescape(const std::string& token) {
        std::string out;
        out.reserve(token.size());
        for (std::size_t i = 0; i < token.size(); ++i) {
            if (token[i] == '~' && i + 1 < token.size()) {
                if (token[i + 1] == '1') { out += '/'; ++i; continue; }
                if (token[i + 1] == '0') { out += '~'; ++i; continue; }
            }
            out += token[i];
        }
        return out;
    }

    // ---- accessors ----

    Kind kind() const noexcept { return kind_; }

    bool is_plain()     const noexcept { return kind_ == Kind::plain; }
    bool is_reference() const noexcept { return kind_ == Kind::reference; }
    bool is_file()      const noexcept { return kind_ == Kind::file; }

    /** True for the whole-document pointer. File pointers are never root. */
    bool is_root() const noexcept { return kind_ != Kind::file && !path_.has_value(); }

    /** Unescaped segments; empty for the root. */
    const std::vector<std::string>& path() const noexcept {
        static const std::vector<std::string> empty;
        return path_ ? *path_ : empty;
    }

    std::size_t size() const noexcept { return path_ ? path_->size() : 0; }

    /** Last segment.  Throws InvalidOperationError for the root. */
    const std::string& back() const {
        if (!path_) {
            throw InvalidOperationError("Root pointer has no last segment.");
        }
        return path_->back();
    }

    /** Raw path of a File pointer; empty for other kinds. */
    const std::string& file_path() const noexcept { return file_; }

    // ---- navigation ----

    /** Immediate parent as a Plain pointer.  The root is its own parent. */
    Pointer parent() const {
        if (!path_ || path_->size() == 1) {
            return Pointer{};
        }
        return from_path(std::vector<std::string>(path_->begin(), path_->end() - 1));
    }

    /** Plain pointer with `segment` appended (segment is unescaped). */
    Pointer child(const std::string& segment) const {
        std::vector<std::string> segments = path();
        segments.push_back(segment);
        return from_path(segments);
    }

    Pointer child(std::size_t index) const {
        return child(std::to_string(index));
    }

    /** Plain pointer with every segment of `sub` appended. */
    Pointer join(const Pointer& sub) const {
        std::vector<std::string> segments = path();
        segments.insert(segments.end(), sub.path().begin(), sub.path().end());
        return from_path(segments);
    }

    /** Same path, Plain kind. */
    Pointer as_plain() const {
        Pointer p = *this;
        if (p.kind_ == Kind::reference) p.kind_ = Kind::plain;
        return p;
    }

    /** True if `other` is a proper prefix of this pointer. */
    bool is_child_of(const Pointer& other) const noexcept {
        if (is_file() || other.is_file() || !path_) return false;
        if (!other.path_) return true;
        const auto& mine   = *path_;
        const auto& theirs = *other.path_;
        if (theirs.size() >= mine.size()) return false;
        for (std::size_t i = 0; i < theirs.size(); ++i) {
            if (mine[i] != theirs[i]) return false;
        }
        return true;
    }

    bool is_parent_of(const Pointer& other) const noexcept {
        return other.is_child_of(*this);
    }

    // ---- formatting ----

    /** RFC 6901 form of the path ("" for root).  File pointers give their path. */
    std::string rfc() const {
        if (is_file()) return file_;
        std::string out;
        if (path_) {
            for (const auto& segment : *path_) {
                out += '/';
                out += escape(segment);
            }
        }
        return out;
    }

    /** Canonical form; parse(to_string()) == *this for every kind. */
    std::string to_string() const {
        switch (kind_) {
            case Kind::reference: return REFERENCE_PREFIX + rfc();
            case Kind::file:      return FILE_PREFIX + file_;
            case Kind::plain:
            default:              return rfc();
        }
    }

    // ---- comparison ----

    bool operator==(const Pointer& other) const {
        if (is_file() || other.is_file()) {
            return is_file() && other.is_file() && file_ == other.file_;
        }
        return path_ == other.path_;
    }

    bool operator!=(const Pointer& other) const { return !(*this == other); }

    std::size_t hash() const noexcept {
        std::size_t h = is_file() ? std::hash<std::string>{}(file_) ^ 0x9e3779b9u : 0;
        if (path_) {
            for (const auto& segment : *path_) {
                h ^= std::hash<std::string>{}(segment) + 0x9e3779b9u + (h << 6) + (h >> 2);
            }
            h ^= path_->size();
        }
        return h;
    }

private:
    Kind                                    kind_ = Kind::plain;
    std::optional<std::vector<std::string>> path_;
    std::string                             file_;

    static bool starts_with(const std::string& s, const char* prefix) noexcept {
        return s.rfind(prefix, 0) == 0;
    }

    static std::string syntax_hint() {
        return "JSON Pointer must start with \"/\" symbol (e.g. \"/a/b/c\") "
               "or be empty string \"\" to reference entire document.";
    }

    // `raw` already satisfies match().
    static Pointer parse_plain(const std::string& raw) {
        Pointer p;
        if (raw.empty()) return p;

        std::vector<std::string> segments;
        std::size_t start = 1;
        while (true) {
            std::size_t slash = raw.find('/', start);
            if (slash == std::string::npos) {
                segments.push_back(unescape(raw.substr(start)));
                break;
            }
            segments.push_back(unescape(raw.substr(start, slash - start)));
            start = slash + 1;
        }
        p.path_ = std::move(segments);
        return p;
    }
};

inline std::ostream& operator<<(std::ostream& out, const Pointer& p) {
    return out << p.to_string();
}

} // namespace jcomp

namespace std {

template<>
struct hash<jcomp::Pointer> {
    std::size_t operator()(const jcomp::Pointer& p) const noexcept { return p.hash(); }
};

} // namespace std
