#include <plume/template/tokenizer.hpp>
#include <plume/log.hpp>
#include <cctype>

namespace plume {

// ---------------------------------------------------------------------------
// Paths and tokens
// ---------------------------------------------------------------------------

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

Result<Path> Path::parse(const std::string& text) {
    Path path;
    size_t start = 0;
    while (true) {
        size_t dot = text.find('.', start);
        std::string seg = text.substr(start, dot == std::string::npos
                                                 ? std::string::npos
                                                 : dot - start);
        if (!is_identifier(seg)) {
            return PlumeError{PlumeError::InvalidSyntax,
                "invalid key path '" + text + "'",
                "keys are letters, digits and '_' separated by '.'"};
        }
        path.segments.push_back(std::move(seg));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return Result<Path>::ok(std::move(path));
}

std::string Path::str() const {
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '.';
        out += segments[i];
    }
    return out;
}

std::size_t Template::loop_count() const {
    std::size_t n = 0;
    for (const auto& t : tokens) {
        if (t.kind == TokenKind::LoopStart) ++n;
    }
    return n;
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Literal:        return "Literal";
    case TokenKind::EscapedLiteral: return "EscapedLiteral";
    case TokenKind::Placeholder:    return "Placeholder";
    case TokenKind::LoopStart:      return "LoopStart";
    case TokenKind::LoopEnd:        return "LoopEnd";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Tokenizer state machine
// ---------------------------------------------------------------------------

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

struct Tokenizer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    std::vector<Token> tokens;
    std::vector<size_t> open_loops;  // indices of unclosed LoopStart tokens

    std::string literal;
    SourcePos literal_pos;

    Tokenizer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    bool opens_tag(size_t at) const {
        return at + 1 < source.size() && source[at] == '{' && source[at + 1] == '{';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    void advance_to(size_t target) {
        while (pos < target) advance();
    }

    SourcePos current_pos() const {
        return {line, col, pos};
    }

    PlumeError error_at(PlumeError::Code code, const std::string& msg,
                        const SourcePos& p, const std::string& hint = "") const {
        PlumeError e{code, msg, hint};
        e.at(filename, p.line, p.col, p.offset);
        return e;
    }

    void append_literal(char c) {
        if (literal.empty()) literal_pos = current_pos();
        literal += c;
    }

    void flush_literal() {
        if (literal.empty()) return;
        Token t;
        t.kind = TokenKind::Literal;
        t.text = std::move(literal);
        t.pos = literal_pos;
        tokens.push_back(std::move(t));
        literal.clear();
    }

    Result<Template> run() {
        while (!at_end()) {
            char c = peek();

            if (c == '\\') {
                if (lex_backslashes()) {
                    auto r = lex_escaped();
                    if (r.is_err()) return std::move(r).error();
                }
                continue;
            }

            if (opens_tag(pos)) {
                auto r = lex_tag();
                if (r.is_err()) return std::move(r).error();
                continue;
            }

            append_literal(c);
            advance();
        }
        flush_literal();

        if (!open_loops.empty()) {
            const Token& outer = tokens[open_loops.front()];
            return error_at(PlumeError::UnterminatedLoop,
                "unclosed {{each " + outer.path.str() + "}} loop",
                outer.pos, "add a matching {{/each}}");
        }

        log::debug("tokenized %s: %zu tokens", filename.c_str(), tokens.size());
        if (log::enabled(log::Trace)) {
            for (size_t i = 0; i < tokens.size(); ++i) {
                const Token& t = tokens[i];
                log::trace("  [%zu] %d:%d %-14s %s", i, t.pos.line, t.pos.col,
                           token_kind_name(t.kind), t.text.c_str());
            }
        }

        Template tmpl;
        tmpl.name = filename;
        tmpl.tokens = std::move(tokens);
        return Result<Template>::ok(std::move(tmpl));
    }

    // A run of N backslashes before "{{" yields N/2 literal backslashes; an
    // odd N escapes the tag. Backslashes elsewhere are ordinary text.
    // Returns true when the following tag is escaped.
    bool lex_backslashes() {
        size_t run_end = pos;
        while (run_end < source.size() && source[run_end] == '\\') ++run_end;
        size_t run = run_end - pos;

        if (!opens_tag(run_end)) {
            while (pos < run_end) {
                append_literal(peek());
                advance();
            }
            return false;
        }

        for (size_t i = 0; i < run; ++i) {
            if (i < run / 2) {
                append_literal('\\');
            }
            advance();
        }
        return run % 2 == 1;
    }

    Status lex_escaped() {
        auto p = current_pos();
        size_t close = source.find("}}", pos + 2);
        if (close == std::string::npos) {
            return error_at(PlumeError::UnterminatedPlaceholder,
                "unclosed escaped placeholder", p,
                "an escaped tag still needs its closing }}");
        }
        flush_literal();
        Token t;
        t.kind = TokenKind::EscapedLiteral;
        t.text = source.substr(pos, close + 2 - pos);
        t.pos = p;
        tokens.push_back(std::move(t));
        advance_to(close + 2);
        return ok_status();
    }

    Status lex_tag() {
        auto p = current_pos();
        size_t close = source.find("}}", pos + 2);
        if (close == std::string::npos) {
            return error_at(PlumeError::UnterminatedPlaceholder,
                "unclosed placeholder", p, "add the closing }}");
        }

        std::string raw = source.substr(pos, close + 2 - pos);
        std::string content = trim(source.substr(pos + 2, close - pos - 2));
        advance_to(close + 2);

        if (!content.empty() && content[0] == '/') {
            return lex_loop_end(content, raw, p);
        }
        if (content.size() > 4 && content.compare(0, 4, "each") == 0 &&
            is_space(content[4])) {
            return lex_loop_start(content.substr(5), raw, p);
        }

        auto path = Path::parse(content);
        if (path.is_err()) {
            return error_at(PlumeError::InvalidSyntax,
                "invalid placeholder '" + raw + "'", p, path.error().hint);
        }

        flush_literal();
        Token t;
        t.kind = TokenKind::Placeholder;
        t.text = std::move(raw);
        t.path = std::move(path).value();
        t.pos = p;
        tokens.push_back(std::move(t));
        return ok_status();
    }

    // args: "<path> |<name>|" with free whitespace
    Status lex_loop_start(const std::string& args, std::string raw, SourcePos p) {
        const char* usage = "expected {{each <key> |<name>|}}";

        size_t open_pipe = args.find('|');
        if (open_pipe == std::string::npos) {
            return error_at(PlumeError::InvalidSyntax,
                "missing |name| binding in '" + raw + "'", p, usage);
        }
        size_t close_pipe = args.find('|', open_pipe + 1);
        if (close_pipe == std::string::npos) {
            return error_at(PlumeError::InvalidSyntax,
                "unclosed |name| binding in '" + raw + "'", p, usage);
        }
        if (!trim(args.substr(close_pipe + 1)).empty()) {
            return error_at(PlumeError::InvalidSyntax,
                "unexpected text after binding in '" + raw + "'", p, usage);
        }

        auto path = Path::parse(trim(args.substr(0, open_pipe)));
        if (path.is_err()) {
            return error_at(PlumeError::InvalidSyntax,
                "invalid loop key in '" + raw + "'", p, usage);
        }
        std::string binding = trim(args.substr(open_pipe + 1, close_pipe - open_pipe - 1));
        if (!is_identifier(binding)) {
            return error_at(PlumeError::InvalidSyntax,
                "invalid binding name '" + binding + "' in '" + raw + "'", p,
                "binding names are letters, digits and '_'");
        }

        flush_literal();
        Token t;
        t.kind = TokenKind::LoopStart;
        t.text = std::move(raw);
        t.path = std::move(path).value();
        t.binding = std::move(binding);
        t.body_begin = tokens.size() + 1;
        t.pos = p;
        open_loops.push_back(tokens.size());
        tokens.push_back(std::move(t));
        return ok_status();
    }

    Status lex_loop_end(const std::string& content, std::string raw, SourcePos p) {
        std::string keyword = trim(content.substr(1));
        if (keyword != "each") {
            return error_at(PlumeError::InvalidSyntax,
                "unknown closing tag '" + raw + "'", p,
                "only {{/each}} closes a block");
        }
        if (open_loops.empty()) {
            return error_at(PlumeError::UnmatchedLoopEnd,
                "{{/each}} without a matching {{each}}", p);
        }

        flush_literal();
        size_t start = open_loops.back();
        open_loops.pop_back();
        size_t end = tokens.size();
        tokens[start].body_end = end;

        Token t;
        t.kind = TokenKind::LoopEnd;
        t.text = std::move(raw);
        t.body_begin = start + 1;
        t.body_end = end;
        t.pos = p;
        tokens.push_back(std::move(t));
        return ok_status();
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<Template> tokenize(const std::string& source, const std::string& filename) {
    Tokenizer tokenizer(source, filename);
    return tokenizer.run();
}

} // namespace plume
