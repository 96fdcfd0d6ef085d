#pragma once

#include <manifold/cargo.hpp>
#include <manifold/log.hpp>
#include <manifold/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace manifold {

// Layered configuration: global < project < environment.
// Upper layers override only the fields they set explicitly.
struct Config {
    std::optional<std::string> cargo_program;    // [cargo] program
    std::optional<std::string> manifest_name;    // [cargo] manifest
    std::optional<log::Level> log_level;         // [log] level
    std::optional<bool> log_color;               // [log] color

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Read $CARGO and $MANIFOLD_LOG
    static Result<Config> from_env();

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // global -> project -> env
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& env);

    // CargoCli configured with the effective program and manifest name
    CargoCli cargo_cli() const;

    // Apply log level and color settings to manifold::log
    void apply_logging() const;
};

// ~/.manifold/config.toml, or empty if HOME is unset
std::string global_config_path();

// <project_dir>/.manifold.toml
std::string project_config_path(const std::filesystem::path& project_dir);

} // namespace manifold
