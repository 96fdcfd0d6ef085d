#include <manifold/config.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace manifold {

static Result<log::Level> level_from_string(const std::string& name, const char* where) {
    auto lvl = log::parse_level(name);
    if (!lvl) {
        return ManifoldError{ManifoldError::Config,
            std::string(where) + ": unknown log level '" + name + "'",
            "expected one of: trace, debug, info, warn, error"};
    }
    return Result<log::Level>::ok(*lvl);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ManifoldError{ManifoldError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [cargo] section
    if (auto cargo = doc["cargo"].as_table()) {
        if (auto v = (*cargo)["program"].value<std::string>()) cfg.cargo_program = *v;
        if (auto v = (*cargo)["manifest"].value<std::string>()) cfg.manifest_name = *v;
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = level_from_string(*v, "log.level");
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
        if (auto v = (*lg)["color"].value<bool>()) cfg.log_color = *v;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return ManifoldError{ManifoldError::IO,
            "cannot open config file: " + path};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return ManifoldError{ManifoldError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return ManifoldError{ManifoldError::IO,
            "failed reading config file: " + path};
    }

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

Result<Config> Config::from_env() {
    Config cfg;
    if (const char* cargo = std::getenv("CARGO"); cargo && *cargo) {
        cfg.cargo_program = cargo;
    }
    if (const char* lvl = std::getenv("MANIFOLD_LOG"); lvl && *lvl) {
        auto parsed = level_from_string(lvl, "MANIFOLD_LOG");
        if (parsed.is_err()) return std::move(parsed).error();
        cfg.log_level = parsed.value();
    }
    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    if (other.cargo_program) cargo_program = other.cargo_program;
    if (other.manifest_name) manifest_name = other.manifest_name;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

CargoCli Config::cargo_cli() const {
    CargoCli cli;
    if (cargo_program) cli.set_program(*cargo_program);
    if (manifest_name) cli.set_manifest_name(*manifest_name);
    return cli;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.manifold/config.toml";
}

std::string project_config_path(const std::filesystem::path& project_dir) {
    return (project_dir / ".manifold.toml").string();
}

} // namespace manifold
