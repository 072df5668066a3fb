#pragma once

#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

// =============================================================================
// jcomp logging
//
// Level-filtered log lines of the form
//
//   [DEBUG] composer.h:142 pass 2: 3 node(s) to revisit
//
// The level and the output stream are process settings changed by
// EngineConfig::apply() or directly by tests.  Messages use fmt syntax.
// =============================================================================

namespace jcomp {
namespace log {

enum Level
{
    off,
    error,
    warning,
    info,
    debug,
};

inline Level& level() {
    static Level current = warning;
    return current;
}

inline std::ostream*& sink() {
    static std::ostream* current = &std::clog;
    return current;
}

inline void set_level(Level value) { level() = value; }
inline void set_sink(std::ostream& out) { sink() = &out; }

inline Level level_from_string(const std::string& name) {
    if (name == "off")     return off;
    if (name == "error")   return error;
    if (name == "warning") return warning;
    if (name == "info")    return info;
    if (name == "debug")   return debug;
    return warning;
}

inline
std::string_view trim_file_name(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? std::string_view{slash + 1} : std::string_view{file};
}

template <typename ... Args>
void write(const char* file, int line, const char* level_name, const char* format, Args&& ... args) {
    std::ostream& out = *sink();
    out << level_name << trim_file_name(file) << ':' << line << ' '
        << fmt::format(fmt::runtime(format), std::forward<Args>(args)...) << '\n';
    out.flush();
}

#define JCOMP_LOG_AT(lvl, name, ...) { if (::jcomp::log::level() >= ::jcomp::log::lvl) ::jcomp::log::write(__FILE__, __LINE__, name, __VA_ARGS__); }

#define JCOMP_DEBUG(...) JCOMP_LOG_AT(debug,   "[DEBUG] ",   __VA_ARGS__)
#define JCOMP_INFO(...)  JCOMP_LOG_AT(info,    "[INFO] ",    __VA_ARGS__)
#define JCOMP_WARN(...)  JCOMP_LOG_AT(warning, "[WARNING] ", __VA_ARGS__)
#define JCOMP_ERROR(...) JCOMP_LOG_AT(error,   "[ERROR] ",   __VA_ARGS__)

} // namespace log
} // namespace jcomp
