#pragma once

#include <manifold/result.hpp>
#include <toml++/toml.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manifold {

// A string field that Cargo also allows to be written as
// `{ workspace = true }`, inheriting the value from [workspace.package].
struct Inheritable {
    std::string value;        // empty when inherited
    bool workspace = false;

    static Inheritable of(std::string v);
    static Inheritable inherited();

    bool is_inherited() const { return workspace; }

    static Result<Inheritable> from_toml(std::string_view key, const toml::node& node);
    void write_to(toml::table& tbl, std::string_view key) const;

    bool operator==(const Inheritable& other) const {
        return workspace == other.workspace && value == other.value;
    }
    bool operator!=(const Inheritable& other) const { return !(*this == other); }
};

// One [[bin]] entry
struct BuildTarget {
    std::string name;
    std::optional<std::string> path;   // Cargo infers src/bin/<name>.rs when absent
    toml::table unhandled;             // required-features, test, bench, ...

    static Result<BuildTarget> from_toml(const toml::table& tbl);
    toml::table to_toml() const;
};

// [package]
struct PackageSection {
    std::string name;
    std::optional<Inheritable> version;
    std::optional<Inheritable> edition;
    // Every other key of [package]; never holds name/version/edition
    toml::table unhandled;

    static Result<PackageSection> from_toml(const toml::table& tbl);
    toml::table to_toml() const;
};

// [workspace.package]
struct WorkspacePackage {
    std::optional<std::string> version;
    toml::table unhandled;

    static Result<WorkspacePackage> from_toml(const toml::table& tbl);
    toml::table to_toml() const;
};

// [workspace]
struct WorkspaceSection {
    std::optional<WorkspacePackage> package;
    std::optional<std::vector<std::string>> members;
    toml::table unhandled;

    static Result<WorkspaceSection> from_toml(const toml::table& tbl);
    toml::table to_toml() const;
};

// [dependencies], carried verbatim
struct DependenciesSection {
    toml::table data;

    static DependenciesSection from_toml(const toml::table& tbl);
    toml::table to_toml() const;
};

// Copy every key of `src` not listed in `consumed` into `dst`.
void copy_unconsumed(const toml::table& src,
                     std::initializer_list<std::string_view> consumed,
                     toml::table& dst);

} // namespace manifold
