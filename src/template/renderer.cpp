#include <plume/template/renderer.hpp>
#include <plume/template/resolver.hpp>
#include <plume/template/tokenizer.hpp>
#include <plume/log.hpp>
#include <vector>

namespace plume {

namespace {

// One active {{each}}; the body is tokens [body_begin, body_end)
struct LoopFrame {
    const Value::List* items;
    size_t next;
    size_t body_begin;
    size_t body_end;
};

PlumeError located(PlumeError e, const Template& tmpl, const Token& tok) {
    e.at(tmpl.name, tok.pos.line, tok.pos.col, tok.pos.offset);
    return e;
}

} // anonymous namespace

Result<std::string> render(const Template& tmpl,
                           const TemplateContext& ctx,
                           const RenderOptions& opts) {
    const auto& tokens = tmpl.tokens;
    std::string out;
    std::vector<LoopFrame> frames;
    Scope scope;
    size_t steps = 0;
    size_t i = 0;

    while (i < tokens.size()) {
        if (opts.max_steps && ++steps > *opts.max_steps) {
            return located(PlumeError::timeout(*opts.max_steps), tmpl, tokens[i]);
        }

        // End of the innermost body: next element, or leave the loop
        if (!frames.empty() && i == frames.back().body_end) {
            LoopFrame& frame = frames.back();
            if (++frame.next < frame.items->size()) {
                scope.rebind(&(*frame.items)[frame.next]);
                i = frame.body_begin;
            } else {
                i = frame.body_end + 1;
                frames.pop_back();
                scope.pop();
            }
            continue;
        }

        const Token& tok = tokens[i];
        switch (tok.kind) {
        case TokenKind::Literal:
        case TokenKind::EscapedLiteral:
            out += tok.text;
            ++i;
            break;

        case TokenKind::Placeholder: {
            auto text = resolve_scalar(tok.path, ctx, scope);
            if (text.is_err()) return located(std::move(text).error(), tmpl, tok);
            out += text.value();
            ++i;
            break;
        }

        case TokenKind::LoopStart: {
            auto value = resolve(tok.path, ctx, scope);
            if (value.is_err()) return located(std::move(value).error(), tmpl, tok);
            const Value* list = value.value();
            if (!list->is_list()) {
                return located(PlumeError::type_mismatch(
                    tok.path.str(), "List", kind_name(list->kind())), tmpl, tok);
            }
            if (tok.body_end < tok.body_begin || tok.body_end >= tokens.size()) {
                return located(PlumeError{PlumeError::UnterminatedLoop,
                    "loop over '" + tok.path.str() + "' has no body span"}, tmpl, tok);
            }
            const auto& items = list->as_list();
            if (items.empty()) {
                i = tok.body_end + 1;
                break;
            }
            frames.push_back({&items, 0, tok.body_begin, tok.body_end});
            scope.push(tok.binding, &items[0]);
            i = tok.body_begin;
            break;
        }

        case TokenKind::LoopEnd:
            // Only a hand-built token sequence gets here; tokenize() always
            // pairs LoopEnd with the frame boundary handled above
            return located(PlumeError{PlumeError::UnmatchedLoopEnd,
                "{{/each}} without a matching {{each}}"}, tmpl, tok);
        }
    }

    log::debug("rendered %s: %zu tokens, %zu steps, %zu bytes",
               tmpl.name.c_str(), tokens.size(), steps, out.size());
    return Result<std::string>::ok(std::move(out));
}

Result<std::string> render(const std::string& source,
                           const TemplateContext& ctx,
                           const RenderOptions& opts) {
    auto tmpl = tokenize(source);
    if (tmpl.is_err()) return std::move(tmpl).error();
    return render(tmpl.value(), ctx, opts);
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

Result<Template> Engine::compile(const std::string& source,
                                 const std::string& name) const {
    return tokenize(source, name);
}

Result<std::string> Engine::render(const Template& tmpl,
                                   const TemplateContext& ctx) const {
    return plume::render(tmpl, ctx, opts_);
}

Result<std::string> Engine::render(const std::string& source,
                                   const TemplateContext& ctx,
                                   const std::string& name) const {
    auto tmpl = compile(source, name);
    if (tmpl.is_err()) return std::move(tmpl).error();
    return plume::render(tmpl.value(), ctx, opts_);
}

} // namespace plume
