#pragma once

#include <plume/value.hpp>
#include <plume/result.hpp>
#include <string>

namespace plume {

// Read-only data a template is rendered against. The root is expected to be
// a table; any other root resolves no keys.
class TemplateContext {
public:
    TemplateContext() = default;
    explicit TemplateContext(Value root) : root_(std::move(root)) {}

    const Value& root() const { return root_; }

    // Build a context from a TOML document
    static Result<TemplateContext> parse_toml(const std::string& toml_str,
                                              const std::string& source_name = "<data>");

    // Load a TOML data file (IO error if unreadable)
    static Result<TemplateContext> load_toml(const std::string& path);

private:
    Value root_;
};

} // namespace plume
