#pragma once

#include <manifold/fields.hpp>
#include <manifold/result.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace manifold {

// A Cargo.toml with typed views over [package], [workspace],
// [dependencies] and [[bin]]. Everything else in the file is carried in
// the raw table and written back unchanged.
class CargoManifest {
public:
    std::optional<PackageSection> package;
    std::optional<WorkspaceSection> workspace;
    std::optional<DependenciesSection> dependencies;
    std::vector<BuildTarget> bin;

    // Read and parse a manifest file
    static Result<CargoManifest> read(const std::filesystem::path& path);

    // Parse TOML text; `path` becomes the default save location
    static Result<CargoManifest> parse(const std::string& toml_str,
                                       const std::filesystem::path& path = {});

    // Split an already parsed table into typed sections.
    // Fails with InvalidManifest when neither [package] nor [workspace] exists.
    static Result<CargoManifest> of(const std::filesystem::path& path, toml::table data);

    // Raw table merged with the current typed sections
    toml::table to_toml() const;

    // TOML text of to_toml(), with keys in the order they had in the source
    std::string to_toml_string() const;

    // Write to the original location, or to `path`. The target is replaced
    // atomically (through a symlink, keeping its mode); on failure it is
    // left as it was.
    Status save() const;
    Status save(const std::filesystem::path& path) const;

    const std::filesystem::path& path() const { return path_; }
    const toml::table& raw() const { return data_; }

    bool is_workspace() const { return workspace.has_value(); }

    // Workspace root without a [package] of its own
    bool is_virtual() const { return workspace.has_value() && !package.has_value(); }

private:
    std::filesystem::path path_;
    toml::table data_;
};

} // namespace manifold
