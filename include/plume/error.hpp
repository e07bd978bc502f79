#pragma once

#include <cstddef>
#include <string>

namespace plume {

struct PlumeError {
    enum Code {
        // Template syntax
        UnterminatedPlaceholder,
        UnterminatedLoop,
        UnmatchedLoopEnd,
        InvalidSyntax,
        // Rendering
        UnknownKey,
        TypeMismatch,
        Timeout,
        // Ambient
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;

    // Source context; line/col are 1-based and 0 when unknown
    std::string file;
    int line = 0;
    int col = 0;
    std::size_t offset = 0;

    // Template context
    std::string path;      // offending dotted path (UnknownKey, TypeMismatch)
    std::string expected;  // TypeMismatch: expected value kind
    std::string actual;    // TypeMismatch: actual value kind

    PlumeError() = default;
    PlumeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PlumeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PlumeError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Template error factories
    static PlumeError unknown_key(const std::string& path);
    static PlumeError type_mismatch(const std::string& path,
                                    const std::string& expected,
                                    const std::string& actual);
    static PlumeError timeout(std::size_t max_steps);

    // Attach a source location; returns *this for chaining
    PlumeError& at(const std::string& f, int l, int c, std::size_t off);

    bool is_template_error() const { return code <= Timeout; }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace plume
