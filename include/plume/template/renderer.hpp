#pragma once

#include <plume/template/context.hpp>
#include <plume/template/token.hpp>
#include <plume/result.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace plume {

constexpr std::size_t kDefaultMaxSteps = 10000000;

struct RenderOptions {
    // Steps (tokens processed plus loop-boundary visits) allowed before the
    // render fails with Timeout. std::nullopt removes the limit.
    std::optional<std::size_t> max_steps = kDefaultMaxSteps;
};

// Render a tokenized template. All-or-nothing: on error no partial output
// is returned. Pure over its inputs, so independent calls may run in
// parallel on shared templates and contexts.
Result<std::string> render(const Template& tmpl,
                           const TemplateContext& ctx,
                           const RenderOptions& opts = RenderOptions());

// Tokenize and render in one call
Result<std::string> render(const std::string& source,
                           const TemplateContext& ctx,
                           const RenderOptions& opts = RenderOptions());

// Bundles render options, usually built from EngineConfig
class Engine {
public:
    Engine() = default;
    explicit Engine(RenderOptions opts) : opts_(opts) {}

    const RenderOptions& options() const { return opts_; }

    Result<Template> compile(const std::string& source,
                             const std::string& name = "<template>") const;

    Result<std::string> render(const Template& tmpl,
                               const TemplateContext& ctx) const;

    Result<std::string> render(const std::string& source,
                               const TemplateContext& ctx,
                               const std::string& name = "<template>") const;

private:
    RenderOptions opts_;
};

} // namespace plume
