#include <plume/template/resolver.hpp>

namespace plume {

void Scope::push(std::string name, const Value* value) {
    frames_.push_back({std::move(name), value});
}

void Scope::pop() {
    if (!frames_.empty()) frames_.pop_back();
}

void Scope::rebind(const Value* value) {
    if (!frames_.empty()) frames_.back().value = value;
}

const Value* Scope::find(const std::string& name) const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (it->name == name) return it->value;
    }
    return nullptr;
}

Result<const Value*> resolve(const Path& path,
                             const TemplateContext& ctx,
                             const Scope& scope) {
    if (path.empty()) {
        return PlumeError{PlumeError::InvalidSyntax, "empty key path"};
    }

    const Value* current = scope.find(path.head());
    if (!current) {
        current = ctx.root().find(path.head());
    }
    if (!current) {
        return PlumeError::unknown_key(path.str());
    }

    for (size_t i = 1; i < path.segments.size(); ++i) {
        current = current->find(path.segments[i]);
        if (!current) {
            return PlumeError::unknown_key(path.str());
        }
    }
    return Result<const Value*>::ok(current);
}

Result<std::string> resolve_scalar(const Path& path,
                                   const TemplateContext& ctx,
                                   const Scope& scope) {
    auto value = resolve(path, ctx, scope);
    if (value.is_err()) return std::move(value).error();
    return value.value()->to_display_string(path.str());
}

} // namespace plume
