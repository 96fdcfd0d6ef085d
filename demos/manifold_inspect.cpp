// manifold_inspect.cpp
//
// Reads a Cargo project's manifest and prints the typed view of it.
//
//     ./manifold_inspect <project_dir>                     # print package/workspace/bin
//     ./manifold_inspect <project_dir> --set-version 0.2.0 # bump [package] version and save
//     ./manifold_inspect <project_dir> --metadata          # run `cargo metadata`, print artifacts
//
// Settings come from ~/.manifold/config.toml, <project_dir>/.manifold.toml,
// $CARGO and $MANIFOLD_LOG.

#include <manifold/config.hpp>
#include <manifold/log.hpp>
#include <manifold/manifest.hpp>
#include <manifold/metadata.hpp>
#include <manifold/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace manifold;

struct Options {
    fs::path project_dir;
    std::optional<std::string> set_version;
    bool metadata = false;
};

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    bool have_dir = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--set-version") {
            if (i + 1 >= argc) {
                return ManifoldError{ManifoldError::InvalidArg,
                    "--set-version needs a value", "usage: --set-version <version>"};
            }
            opts.set_version = argv[++i];
        } else if (arg == "--metadata") {
            opts.metadata = true;
        } else if (!have_dir) {
            opts.project_dir = arg;
            have_dir = true;
        } else {
            return ManifoldError{ManifoldError::InvalidArg,
                "unexpected argument: " + arg};
        }
    }

    if (!have_dir) {
        return ManifoldError{ManifoldError::InvalidArg,
            "no project directory specified",
            "usage: manifold_inspect <project_dir> [--set-version <v>] [--metadata]"};
    }
    return Result<Options>::ok(std::move(opts));
}

// Global and project config files are optional; a missing file is skipped.
Result<Config> load_config(const fs::path& project_dir) {
    std::optional<Config> global, project;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto g = Config::load(gpath);
        MANIFOLD_TRY(g);
        global = std::move(g).value();
    }

    std::string ppath = project_config_path(project_dir);
    if (fs::exists(ppath)) {
        auto p = Config::load(ppath);
        MANIFOLD_TRY(p);
        project = std::move(p).value();
    }

    auto env = Config::from_env();
    MANIFOLD_TRY(env);

    return Result<Config>::ok(Config::effective(global, project, env.value()));
}

static std::string describe(const std::optional<Inheritable>& field) {
    if (!field) return "(unset)";
    if (field->is_inherited()) return "(inherited from workspace)";
    return field->value;
}

void print_manifest(const CargoManifest& m) {
    std::cout << "manifest: " << m.path().string() << "\n";
    if (m.package) {
        std::cout << "package: " << m.package->name << "\n"
                  << "  version: " << describe(m.package->version) << "\n"
                  << "  edition: " << describe(m.package->edition) << "\n"
                  << "  other keys: " << m.package->unhandled.size() << "\n";
    }
    if (m.workspace) {
        std::cout << (m.is_virtual() ? "virtual workspace" : "workspace") << "\n";
        if (m.workspace->members) {
            for (const auto& member : *m.workspace->members) {
                std::cout << "  member: " << member << "\n";
            }
        }
    }
    if (m.dependencies) {
        std::cout << "dependencies: " << m.dependencies->data.size() << "\n";
    }
    for (const auto& b : m.bin) {
        std::cout << "bin: " << b.name;
        if (b.path) std::cout << " (" << *b.path << ")";
        std::cout << "\n";
    }
}

Status run(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    MANIFOLD_TRY(opts);

    auto cfg = load_config(opts.value().project_dir);
    MANIFOLD_TRY(cfg);
    cfg.value().apply_logging();

    CargoCli cli = cfg.value().cargo_cli();
    auto manifest = CargoManifest::read(opts.value().project_dir / cli.manifest_name());
    MANIFOLD_TRY(manifest);
    auto& m = manifest.value();

    if (opts.value().set_version) {
        if (!m.package) {
            return ManifoldError{ManifoldError::InvalidManifest,
                "cannot set version: manifest has no [package]",
                "virtual workspaces keep their version in [workspace.package]"};
        }
        m.package->version = Inheritable::of(*opts.value().set_version);
        MANIFOLD_TRY(m.save());
        log::info("set %s version to %s", m.package->name.c_str(),
                  opts.value().set_version->c_str());
    }

    print_manifest(m);

    if (opts.value().metadata) {
        auto md = CargoMetadata::read(opts.value().project_dir, cli);
        MANIFOLD_TRY(md);
        nlohmann::json out = nlohmann::json::array();
        for (const auto& a : md.value().artifacts()) out.push_back(a.to_json());
        std::cout << out.dump(2) << "\n";
    }

    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
