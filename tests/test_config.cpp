#include <catch2/catch.hpp>
#include <manifold/config.hpp>

#include <cstdlib>
#include <filesystem>

using namespace manifold;

// Sets an environment variable for the lifetime of the guard
struct EnvGuard {
    std::string name;
    explicit EnvGuard(std::string n, const char* value) : name(std::move(n)) {
        setenv(name.c_str(), value, 1);
    }
    ~EnvGuard() { unsetenv(name.c_str()); }
};

// ===== Parsing =====

TEST_CASE("parse full config", "[config]") {
    auto r = Config::parse(R"(
[cargo]
program = "/opt/rust/bin/cargo"
manifest = "Cargo.toml"

[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    auto& cfg = r.value();
    REQUIRE(cfg.cargo_program == "/opt/rust/bin/cargo");
    REQUIRE(cfg.manifest_name == "Cargo.toml");
    REQUIRE(cfg.log_level == log::Debug);
    REQUIRE(cfg.log_color == false);
}

TEST_CASE("parse empty config leaves everything unset", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().cargo_program.has_value());
    REQUIRE_FALSE(r.value().manifest_name.has_value());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE_FALSE(r.value().log_color.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ManifoldError::Parse);
}

TEST_CASE("unknown log level is a config error", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "loud"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ManifoldError::Config);
    REQUIRE(r.error().message.find("loud") != std::string::npos);
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent/.manifold.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ManifoldError::IO);
}

TEST_CASE("load directory as config file", "[config]") {
    auto r = Config::load(std::filesystem::temp_directory_path().string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ManifoldError::IO);
}

// ===== Layering =====

TEST_CASE("merge overrides only set fields", "[config]") {
    auto base = Config::parse(R"(
[cargo]
program = "cargo-global"
manifest = "Cargo.toml"

[log]
level = "warn"
)").value();
    auto over = Config::parse(R"(
[cargo]
program = "cargo-project"
)").value();

    base.merge(over);
    REQUIRE(base.cargo_program == "cargo-project");
    REQUIRE(base.manifest_name == "Cargo.toml");
    REQUIRE(base.log_level == log::Warn);
}

TEST_CASE("effective config layers global, project, env", "[config]") {
    Config global;
    global.cargo_program = "g";
    global.log_level = log::Error;
    Config project;
    project.cargo_program = "p";
    Config env;
    env.log_level = log::Trace;

    auto cfg = Config::effective(global, project, env);
    REQUIRE(cfg.cargo_program == "p");
    REQUIRE(cfg.log_level == log::Trace);

    auto none = Config::effective(std::nullopt, std::nullopt, std::nullopt);
    REQUIRE_FALSE(none.cargo_program.has_value());
}

TEST_CASE("from_env reads CARGO and MANIFOLD_LOG", "[config]") {
    EnvGuard cargo("CARGO", "/usr/local/bin/cargo");
    EnvGuard lvl("MANIFOLD_LOG", "trace");

    auto r = Config::from_env();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().cargo_program == "/usr/local/bin/cargo");
    REQUIRE(r.value().log_level == log::Trace);
}

TEST_CASE("from_env rejects a bad MANIFOLD_LOG", "[config]") {
    EnvGuard lvl("MANIFOLD_LOG", "chatty");
    auto r = Config::from_env();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ManifoldError::Config);
}

// ===== Consumers =====

TEST_CASE("cargo_cli uses configured program and manifest", "[config]") {
    Config cfg;
    REQUIRE(cfg.cargo_cli().program() == "cargo");
    REQUIRE(cfg.cargo_cli().manifest_name() == "Cargo.toml");

    cfg.cargo_program = "/opt/cargo";
    cfg.manifest_name = "Custom.toml";
    auto cli = cfg.cargo_cli();
    REQUIRE(cli.program() == "/opt/cargo");
    REQUIRE(cli.metadata_args("/p").back() == "/p/Custom.toml");
}

TEST_CASE("apply_logging sets the log threshold", "[config]") {
    Config cfg;
    cfg.log_level = log::Error;
    cfg.log_color = false;
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

TEST_CASE("config paths", "[config]") {
    REQUIRE(project_config_path("/work/kiln") == "/work/kiln/.manifold.toml");
    EnvGuard home("HOME", "/home/ada");
    REQUIRE(global_config_path() == "/home/ada/.manifold/config.toml");
}
