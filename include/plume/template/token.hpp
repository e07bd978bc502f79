#pragma once

#include <plume/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace plume {

// Source position for error reporting
struct SourcePos {
    int line = 1;
    int col = 1;
    std::size_t offset = 0;  // byte offset into the template
};

// Dotted key path: a.b.c
struct Path {
    std::vector<std::string> segments;

    // Segments are [A-Za-z0-9_]+ joined by '.'; anything else is InvalidSyntax
    static Result<Path> parse(const std::string& text);

    std::string str() const;
    bool empty() const { return segments.empty(); }
    const std::string& head() const { return segments.front(); }
    std::size_t size() const { return segments.size(); }

    bool operator==(const Path& o) const { return segments == o.segments; }
};

// True for a single path segment
bool is_identifier(const std::string& s);

enum class TokenKind {
    Literal,         // text copied verbatim
    EscapedLiteral,  // \{{...}} emitted as {{...}}
    Placeholder,     // {{a.b}}
    LoopStart,       // {{each items |item|}}
    LoopEnd          // {{/each}}
};

struct Token {
    TokenKind kind = TokenKind::Literal;
    std::string text;     // output text for literals, the raw tag otherwise
    Path path;            // Placeholder, LoopStart
    std::string binding;  // LoopStart

    // Loop body span [body_begin, body_end) into Template::tokens. Both the
    // LoopStart and its LoopEnd carry it; body_end is the LoopEnd's index and
    // body_begin - 1 the LoopStart's.
    std::size_t body_begin = 0;
    std::size_t body_end = 0;

    SourcePos pos;
};

// Tokenized template. Built once by tokenize(), read-only afterwards and
// safe to share between threads.
struct Template {
    std::string name;
    std::vector<Token> tokens;

    std::size_t loop_count() const;
};

const char* token_kind_name(TokenKind k);

} // namespace plume
