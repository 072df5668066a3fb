#pragma once

#include <stdexcept>
#include <string>

// =============================================================================
// jcomp error hierarchy
//
// Every failure raised by the engine derives from jcomp::Error, which is a
// std::runtime_error, so callers may catch at whatever granularity they need:
//
//   SyntaxError                   malformed pointer or directive string
//   NotFoundError                 missing key / index / non-container mid-path
//   InvalidOperationError         forbidden operation (root update, bad args)
//   ResolutionError               string-directive reference cannot be resolved
//   UnresolvableCompositionError  fixpoint made no progress
//   CompositionError              handler failure, tagged with its pointer
//     CycleError                  direct or mutual reference cycle
//   FileError                     fixture file missing or unparsable
//   ConfigError                   engine configuration is invalid
// =============================================================================

namespace jcomp {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

class SyntaxError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

class InvalidOperationError : public Error {
public:
    using Error::Error;
};

class ResolutionError : public Error {
public:
    using Error::Error;
};

class UnresolvableCompositionError : public Error {
public:
    using Error::Error;
};

/**
 * Raised by the Composer when a composition handler throws.
 * Keeps the pointer of the directive being composed alongside the
 * original message.
 */
class CompositionError : public Error {
public:
    CompositionError(const std::string& pointer, const std::string& cause)
        : CompositionError(describe(pointer, cause), pointer, cause)
    {
    }

    const std::string& pointer() const noexcept { return pointer_; }
    const std::string& cause()   const noexcept { return cause_; }

protected:
    CompositionError(const std::string& message, const std::string& pointer, const std::string& cause)
        : Error(message)
        , pointer_(pointer)
        , cause_(cause)
    {
    }

    static std::string describe(const std::string& pointer, const std::string& cause) {
        return "Error occurred on composing value at pointer \"" + pointer + "\": " + cause;
    }

private:
    std::string pointer_;
    std::string cause_;
};

/**
 * Direct or mutual reference cycle.  Raised bare by handlers and the
 * reference resolver (empty pointer()); the Composer rethrows it tagged
 * with the composing pointer, still as a CycleError.
 */
class CycleError : public CompositionError {
public:
    explicit CycleError(const std::string& message)
        : CompositionError(message, std::string(), message)
    {
    }

    CycleError(const std::string& pointer, const std::string& cause)
        : CompositionError(describe(pointer, cause), pointer, cause)
    {
    }
};

class FileError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace jcomp
