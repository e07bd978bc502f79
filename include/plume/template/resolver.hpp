#pragma once

#include <plume/template/context.hpp>
#include <plume/template/token.hpp>
#include <plume/value.hpp>
#include <plume/result.hpp>
#include <string>
#include <vector>

namespace plume {

// Loop-variable overlay: a stack of (name, value) bindings searched
// innermost first. Bound values are borrowed from the context tree.
class Scope {
public:
    void push(std::string name, const Value* value);
    void pop();

    // Point the innermost binding at the next loop element
    void rebind(const Value* value);

    // Innermost binding with this name, nullptr if unbound
    const Value* find(const std::string& name) const;

    std::size_t depth() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

private:
    struct Binding {
        std::string name;
        const Value* value;
    };
    std::vector<Binding> frames_;
};

// Resolve a dotted path. The first segment is looked up in the scope, then
// in the context root; each further segment indexes a table. Missing keys
// and indexing into non-tables are UnknownKey with the full path.
Result<const Value*> resolve(const Path& path,
                             const TemplateContext& ctx,
                             const Scope& scope = Scope());

// resolve() followed by stringification; lists and tables are TypeMismatch
Result<std::string> resolve_scalar(const Path& path,
                                   const TemplateContext& ctx,
                                   const Scope& scope = Scope());

} // namespace plume
