#include <manifold/fields.hpp>

namespace manifold {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool is_consumed(std::string_view key,
                        std::initializer_list<std::string_view> consumed) {
    for (auto c : consumed) {
        if (c == key) return true;
    }
    return false;
}

void copy_unconsumed(const toml::table& src,
                     std::initializer_list<std::string_view> consumed,
                     toml::table& dst) {
    for (const auto& [key, val] : src) {
        std::string k(key.str());
        if (is_consumed(k, consumed)) continue;
        val.visit([&](const auto& concrete) {
            dst.insert_or_assign(k, concrete);
        });
    }
}

static ManifoldError invalid(const std::string& msg) {
    return ManifoldError{ManifoldError::InvalidManifest, msg};
}

static Result<std::optional<std::string>> optional_string(const toml::table& tbl,
                                                          const std::string& section,
                                                          std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::optional<std::string>>::ok(std::nullopt);
    auto s = node->value<std::string>();
    if (!s) {
        return invalid(section + "." + std::string(key) + " must be a string");
    }
    return Result<std::optional<std::string>>::ok(std::move(s));
}

static Result<std::optional<Inheritable>> optional_inheritable(const toml::table& tbl,
                                                               const std::string& section,
                                                               std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::optional<Inheritable>>::ok(std::nullopt);
    auto parsed = Inheritable::from_toml(section + "." + std::string(key), *node);
    if (parsed.is_err()) return std::move(parsed).error();
    return Result<std::optional<Inheritable>>::ok(std::move(parsed).value());
}

// ---------------------------------------------------------------------------
// Inheritable
// ---------------------------------------------------------------------------

Inheritable Inheritable::of(std::string v) {
    Inheritable i;
    i.value = std::move(v);
    return i;
}

Inheritable Inheritable::inherited() {
    Inheritable i;
    i.workspace = true;
    return i;
}

Result<Inheritable> Inheritable::from_toml(std::string_view key, const toml::node& node) {
    if (auto s = node.value<std::string>()) {
        return Result<Inheritable>::ok(Inheritable::of(std::move(*s)));
    }
    if (auto tbl = node.as_table()) {
        auto ws = (*tbl)["workspace"].value<bool>();
        if (tbl->size() == 1 && ws && *ws) {
            return Result<Inheritable>::ok(Inheritable::inherited());
        }
    }
    return ManifoldError{ManifoldError::InvalidManifest,
        std::string(key) + " must be a string or { workspace = true }"};
}

void Inheritable::write_to(toml::table& tbl, std::string_view key) const {
    if (workspace) {
        toml::table inherit;
        inherit.insert_or_assign("workspace", true);
        inherit.is_inline(true);
        tbl.insert_or_assign(std::string(key), std::move(inherit));
    } else {
        tbl.insert_or_assign(std::string(key), value);
    }
}

// ---------------------------------------------------------------------------
// BuildTarget
// ---------------------------------------------------------------------------

Result<BuildTarget> BuildTarget::from_toml(const toml::table& tbl) {
    BuildTarget bt;

    auto name = tbl["name"].value<std::string>();
    if (!name) {
        return invalid("[[bin]] entry is missing a string 'name'");
    }
    bt.name = std::move(*name);

    auto path = optional_string(tbl, "bin." + bt.name, "path");
    if (path.is_err()) return std::move(path).error();
    bt.path = std::move(path).value();

    copy_unconsumed(tbl, {"name", "path"}, bt.unhandled);
    return Result<BuildTarget>::ok(std::move(bt));
}

toml::table BuildTarget::to_toml() const {
    toml::table out;
    copy_unconsumed(unhandled, {"name", "path"}, out);
    out.insert_or_assign("name", name);
    if (path) out.insert_or_assign("path", *path);
    return out;
}

// ---------------------------------------------------------------------------
// PackageSection
// ---------------------------------------------------------------------------

Result<PackageSection> PackageSection::from_toml(const toml::table& tbl) {
    PackageSection pkg;

    const toml::node* name = tbl.get("name");
    if (!name) {
        return ManifoldError{ManifoldError::InvalidManifest,
            "[package] is missing required key 'name'",
            "add name = \"<crate-name>\" under [package]"};
    }
    auto s = name->value<std::string>();
    if (!s) return invalid("package.name must be a string");
    pkg.name = std::move(*s);

    auto version = optional_inheritable(tbl, "package", "version");
    if (version.is_err()) return std::move(version).error();
    pkg.version = std::move(version).value();

    auto edition = optional_inheritable(tbl, "package", "edition");
    if (edition.is_err()) return std::move(edition).error();
    pkg.edition = std::move(edition).value();

    copy_unconsumed(tbl, {"name", "version", "edition"}, pkg.unhandled);
    return Result<PackageSection>::ok(std::move(pkg));
}

toml::table PackageSection::to_toml() const {
    toml::table out;
    copy_unconsumed(unhandled, {"name", "version", "edition"}, out);
    out.insert_or_assign("name", name);
    if (version) version->write_to(out, "version");
    if (edition) edition->write_to(out, "edition");
    return out;
}

// ---------------------------------------------------------------------------
// WorkspacePackage
// ---------------------------------------------------------------------------

Result<WorkspacePackage> WorkspacePackage::from_toml(const toml::table& tbl) {
    WorkspacePackage wp;

    auto version = optional_string(tbl, "workspace.package", "version");
    if (version.is_err()) return std::move(version).error();
    wp.version = std::move(version).value();

    copy_unconsumed(tbl, {"version"}, wp.unhandled);
    return Result<WorkspacePackage>::ok(std::move(wp));
}

toml::table WorkspacePackage::to_toml() const {
    toml::table out;
    copy_unconsumed(unhandled, {"version"}, out);
    if (version) out.insert_or_assign("version", *version);
    return out;
}

// ---------------------------------------------------------------------------
// WorkspaceSection
// ---------------------------------------------------------------------------

Result<WorkspaceSection> WorkspaceSection::from_toml(const toml::table& tbl) {
    WorkspaceSection ws;

    if (const toml::node* pkg = tbl.get("package")) {
        auto pkg_tbl = pkg->as_table();
        if (!pkg_tbl) return invalid("workspace.package must be a table");
        auto parsed = WorkspacePackage::from_toml(*pkg_tbl);
        if (parsed.is_err()) return std::move(parsed).error();
        ws.package = std::move(parsed).value();
    }

    if (const toml::node* members = tbl.get("members")) {
        auto arr = members->as_array();
        if (!arr) return invalid("workspace.members must be an array of strings");
        std::vector<std::string> list;
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) return invalid("workspace.members must be an array of strings");
            list.push_back(std::move(*s));
        }
        ws.members = std::move(list);
    }

    copy_unconsumed(tbl, {"package", "members"}, ws.unhandled);
    return Result<WorkspaceSection>::ok(std::move(ws));
}

toml::table WorkspaceSection::to_toml() const {
    toml::table out;
    copy_unconsumed(unhandled, {"package", "members"}, out);
    if (package) out.insert_or_assign("package", package->to_toml());
    if (members && !members->empty()) {
        toml::array arr;
        for (const auto& m : *members) arr.push_back(m);
        out.insert_or_assign("members", std::move(arr));
    }
    return out;
}

// ---------------------------------------------------------------------------
// DependenciesSection
// ---------------------------------------------------------------------------

DependenciesSection DependenciesSection::from_toml(const toml::table& tbl) {
    return DependenciesSection{tbl};
}

toml::table DependenciesSection::to_toml() const {
    return data;
}

} // namespace manifold
