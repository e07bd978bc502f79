#include <plume/config.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace plume {

static PlumeError config_error(const std::string& key, const std::string& what) {
    return PlumeError{PlumeError::Config,
        "invalid config value for " + key + ": " + what};
}

Result<EngineConfig> EngineConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PlumeError{PlumeError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    EngineConfig cfg;

    // [render] section
    if (auto render = doc["render"].as_table()) {
        for (const auto& [key, val] : *render) {
            std::string k(key.str());
            if (k == "max-steps") {
                auto v = val.as_integer();
                if (!v || v->get() <= 0) {
                    return config_error("[render] max-steps", "expected a positive integer");
                }
                cfg.rendering.max_steps = static_cast<std::size_t>(v->get());
                cfg.max_steps_set = true;
            } else if (k == "unlimited") {
                auto v = val.as_boolean();
                if (!v) return config_error("[render] unlimited", "expected a boolean");
                cfg.rendering.unlimited = v->get();
                cfg.unlimited_set = true;
            } else {
                log::warn("ignoring unknown config key [render] %s", k.c_str());
            }
        }
    }

    // [log] section
    if (auto logs = doc["log"].as_table()) {
        for (const auto& [key, val] : *logs) {
            std::string k(key.str());
            if (k == "level") {
                auto v = val.as_string();
                if (!v) return config_error("[log] level", "expected a string");
                auto lvl = log::parse_level(v->get());
                if (lvl.is_err()) return std::move(lvl).error();
                cfg.logging.level = lvl.value();
                cfg.log_level_set = true;
            } else if (k == "color") {
                auto v = val.as_boolean();
                if (!v) return config_error("[log] color", "expected a boolean");
                cfg.logging.color = v->get();
                cfg.log_color_set = true;
            } else {
                log::warn("ignoring unknown config key [log] %s", k.c_str());
            }
        }
    }

    return Result<EngineConfig>::ok(std::move(cfg));
}

Result<EngineConfig> EngineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PlumeError{PlumeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = EngineConfig::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void EngineConfig::merge(const EngineConfig& other) {
    if (other.max_steps_set) {
        rendering.max_steps = other.rendering.max_steps;
        max_steps_set = true;
    }
    if (other.unlimited_set) {
        rendering.unlimited = other.rendering.unlimited;
        unlimited_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

EngineConfig EngineConfig::effective(const std::optional<EngineConfig>& global,
                                     const std::optional<EngineConfig>& project,
                                     const std::optional<EngineConfig>& local) {
    EngineConfig result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

RenderOptions EngineConfig::render_options() const {
    RenderOptions opts;
    if (rendering.unlimited) {
        opts.max_steps = std::nullopt;
    } else {
        opts.max_steps = rendering.max_steps;
    }
    return opts;
}

void EngineConfig::apply_log() const {
    if (log_level_set) log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.plume/config.toml";
}

std::string find_project_config(const std::string& start_dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::absolute(start_dir.empty() ? "." : start_dir, ec);
    if (ec) return "";

    while (true) {
        fs::path candidate = dir / "plume.toml";
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return "";
}

} // namespace plume
