#pragma once

#include <plume/result.hpp>
#include <plume/log.hpp>
#include <plume/template/renderer.hpp>
#include <optional>
#include <string>

namespace plume {

struct RenderConfig {
    std::size_t max_steps = kDefaultMaxSteps;
    bool unlimited = false;
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global > project > local
// Lower layers override higher layers (local wins over project wins over global)
struct EngineConfig {
    RenderConfig rendering;
    LogConfig logging;
    // Track which fields were explicitly set (for merge)
    bool max_steps_set = false;
    bool unlimited_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<EngineConfig> load(const std::string& path);

    // Parse from TOML string
    static Result<EngineConfig> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values override this)
    void merge(const EngineConfig& other);

    // Build effective config from layers: global -> project -> local
    static EngineConfig effective(const std::optional<EngineConfig>& global,
                                  const std::optional<EngineConfig>& project,
                                  const std::optional<EngineConfig>& local);

    RenderOptions render_options() const;

    // Push the [log] settings that were set into plume::log
    void apply_log() const;
};

// Discover the global config file path: ~/.plume/config.toml
std::string global_config_path();

// Nearest plume.toml in start_dir or one of its parents; empty if none
std::string find_project_config(const std::string& start_dir);

} // namespace plume
