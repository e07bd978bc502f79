// plume_render.cpp
//
// Render one template against a TOML data file:
//
//     ./plume_render meta.tmp.typ paper.toml              # print to stdout
//     ./plume_render meta.tmp.typ paper.toml -o meta.typ  # write a file
//     ./plume_render meta.tmp.typ paper.toml --max-steps 1000
//
// Settings come from ~/.plume/config.toml, then the nearest plume.toml at or
// above the template's directory, then --config <file>, then the command
// line. Set PLUME_LOG=debug to see what the engine is doing.

#include <plume/config.hpp>
#include <plume/log.hpp>
#include <plume/output.hpp>
#include <plume/result.hpp>
#include <plume/template/context.hpp>
#include <plume/template/renderer.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace plume;

struct Args {
    std::string template_path;
    std::string data_path;
    std::string output_path;
    std::string config_path;
    std::optional<std::size_t> max_steps;
};

static const char* kUsage =
    "usage: plume_render <template> <data.toml> [-o <out>] [--config <file>] [--max-steps N]";

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return PlumeError{PlumeError::InvalidArg,
                    flag + " needs a value", kUsage};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "-o" || a == "--output") {
            auto v = next(a);
            if (v.is_err()) return std::move(v).error();
            args.output_path = v.value();
        } else if (a == "--config") {
            auto v = next(a);
            if (v.is_err()) return std::move(v).error();
            args.config_path = v.value();
        } else if (a == "--max-steps") {
            auto v = next(a);
            if (v.is_err()) return std::move(v).error();
            char* end = nullptr;
            unsigned long long n = std::strtoull(v.value().c_str(), &end, 10);
            if (v.value().empty() || *end != '\0' || n == 0) {
                return PlumeError{PlumeError::InvalidArg,
                    "--max-steps expects a positive integer, got '" + v.value() + "'"};
            }
            args.max_steps = static_cast<std::size_t>(n);
        } else if (!a.empty() && a[0] == '-') {
            return PlumeError{PlumeError::InvalidArg, "unknown option " + a, kUsage};
        } else if (positional == 0) {
            args.template_path = a;
            ++positional;
        } else if (positional == 1) {
            args.data_path = a;
            ++positional;
        } else {
            return PlumeError{PlumeError::InvalidArg,
                "unexpected argument " + a, kUsage};
        }
    }
    if (positional < 2) {
        return PlumeError{PlumeError::InvalidArg,
            "missing template or data file", kUsage};
    }
    return Result<Args>::ok(std::move(args));
}

static Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return PlumeError{PlumeError::IO,
            "could not open file: " + path, "check the path and permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

static Result<EngineConfig> load_config(const Args& args) {
    std::optional<EngineConfig> global;
    std::string gpath = global_config_path();
    std::error_code ec;
    if (!gpath.empty() && fs::exists(gpath, ec)) {
        auto cfg = EngineConfig::load(gpath);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::optional<EngineConfig> project;
    fs::path template_dir = fs::path(args.template_path).parent_path();
    std::string ppath = find_project_config(template_dir.string());
    if (!ppath.empty()) {
        auto cfg = EngineConfig::load(ppath);
        if (cfg.is_err()) return std::move(cfg).error();
        log::debug("using project config %s", ppath.c_str());
        project = std::move(cfg).value();
    }

    std::optional<EngineConfig> local;
    if (!args.config_path.empty()) {
        auto cfg = EngineConfig::load(args.config_path);
        if (cfg.is_err()) return std::move(cfg).error();
        local = std::move(cfg).value();
    }

    return Result<EngineConfig>::ok(EngineConfig::effective(global, project, local));
}

static Status run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) return std::move(args).error();
    const Args& a = args.value();

    auto cfg = load_config(a);
    if (cfg.is_err()) return std::move(cfg).error();
    cfg.value().apply_log();

    RenderOptions opts = cfg.value().render_options();
    if (a.max_steps) opts.max_steps = a.max_steps;

    auto source = read_file(a.template_path);
    if (source.is_err()) return std::move(source).error();

    auto ctx = TemplateContext::load_toml(a.data_path);
    if (ctx.is_err()) return std::move(ctx).error();

    Engine engine(opts);
    auto rendered = engine.render(source.value(), ctx.value(), a.template_path);
    if (rendered.is_err()) return std::move(rendered).error();

    if (a.output_path.empty()) {
        std::cout << rendered.value();
        std::cout.flush();
        return ok_status();
    }

    PLUME_TRY(write_file_atomic(a.output_path, rendered.value()));
    log::info("wrote %s (%zu bytes)", a.output_path.c_str(), rendered.value().size());
    return ok_status();
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto status = run(argc, argv);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
