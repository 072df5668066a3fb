#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "errors.h"
#include "json.h"
#include "logging.h"

namespace jcomp {

/**
 * Fixture file access shared by the file-reference handlers and the
 * string-directive resolver.
 *
 * Two formats are understood:
 *   json  parsed with nlohmann::ordered_json; syntax errors name the file, the line,
 *         the column and echo the offending line;
 *   text  returned verbatim as a JSON string.
 * When no format is given it is inferred from the extension (".json" ->
 * json, anything else -> text).
 */
class DataReader {
public:
    static constexpr const char* FORMAT_JSON = "json";
    static constexpr const char* FORMAT_TEXT = "text";

    /** Read the whole file.  Throws FileError if it is missing or unreadable. */
    static std::string read_text_file(const std::filesystem::path& path) {
        JCOMP_DEBUG("Reading file: {}", path.string());
        if (!std::filesystem::exists(path)) {
            throw FileError("Failed to find \"" + path.string() + "\" file.");
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw FileError("Failed to open \"" + path.string() + "\" file for reading.");
        }
        return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    }

    static json read_json_file(const std::filesystem::path& path) {
        return parse_json(read_text_file(path), path.string());
    }

    /**
     * Read `path` in the given format ("json" / "text"); an empty format is
     * inferred from the extension.  Throws FileError on unknown formats.
     */
    static json read_file(const std::filesystem::path& path, const std::string& format = "") {
        const std::string effective = format.empty() ? infer_format(path) : lower(format);
        if (effective == FORMAT_JSON) return read_json_file(path);
        if (effective == FORMAT_TEXT || effective == "txt") return read_text_file(path);
        throw FileError("Unsupported file format \"" + format + "\" for \"" + path.string()
                        + "\". Expected \"json\" or \"text\".");
    }

    static std::string infer_format(const std::filesystem::path& path) {
        return lower(path.extension().string()) == ".json" ? FORMAT_JSON : FORMAT_TEXT;
    }

    /** Parse `text`; `origin` names the source in error messages. */
    static json parse_json(const std::string& text, const std::string& origin) {
        try {
            return json::parse(text);
        } catch (const json::parse_error& err) {
            throw FileError("Syntax error occurred during \"" + origin + "\" file parsing. "
                            + locate(text, err.byte) + "\n" + err.what());
        }
    }

private:
    static std::string lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    // "Failed on line L (char: C):\n<line>\n    ^" for a 1-based byte offset.
    static std::string locate(const std::string& text, std::size_t byte) {
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
            return "No content to parse.";
        }
        const std::size_t offset = byte == 0 ? 0 : std::min(byte - 1, text.size());
        std::size_t line_start = text.rfind('\n', offset == 0 ? 0 : offset - 1);
        line_start = (line_start == std::string::npos) ? 0 : line_start + 1;
        std::size_t line_end = text.find('\n', line_start);
        if (line_end == std::string::npos) line_end = text.size();

        const std::size_t line_no = 1 + static_cast<std::size_t>(
            std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(line_start), '\n'));
        const std::size_t column = offset >= line_start ? offset - line_start : 0;

        return "Failed on line " + std::to_string(line_no) + " (char: " + std::to_string(column) + "):\n"
             + text.substr(line_start, line_end - line_start) + "\n"
             + std::string(column, ' ') + "^";
    }
};

} // namespace jcomp
