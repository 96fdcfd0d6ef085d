#include <manifold/metadata.hpp>
#include <manifold/log.hpp>
#include <algorithm>
#include <optional>
#include <unordered_set>

namespace manifold {

using json = nlohmann::json;

const char* artifact_kind_name(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Binary:  return "bin";
        case ArtifactKind::Library: return "lib";
    }
    return "unknown";
}

json Artifact::to_json() const {
    return json{{"name", name}, {"path", path}, {"kind", artifact_kind_name(kind)}};
}

// ---------------------------------------------------------------------------
// Target classification
// ---------------------------------------------------------------------------

// Known kind tags, checked in order. A library with an explicit
// crate-type is reported with that type as its kind ("cdylib", "rlib",
// ...) and no "lib" tag, so it is skipped like any other unknown kind.
static const std::pair<const char*, ArtifactKind> kKnownKinds[] = {
    {"bin", ArtifactKind::Binary},
    {"lib", ArtifactKind::Library},
};

static std::optional<ArtifactKind> classify_target(const std::vector<std::string>& kinds) {
    for (const auto& [tag, kind] : kKnownKinds) {
        if (std::find(kinds.begin(), kinds.end(), tag) != kinds.end()) {
            return kind;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// CargoMetadata
// ---------------------------------------------------------------------------

Result<CargoMetadata> CargoMetadata::of(const std::filesystem::path& project_dir,
                                        json data) {
    CargoMetadata md;
    md.project_dir_ = project_dir;

    try {
        std::unordered_set<std::string> member_ids;
        for (const auto& id : data.at("workspace_members")) {
            member_ids.insert(id.get<std::string>());
        }

        for (const auto& package : data.at("packages")) {
            auto id = package.at("id").get<std::string>();
            if (member_ids.count(id) == 0) continue;

            WorkspaceMember wm;
            wm.id = id;
            wm.name = package.at("name").get<std::string>();
            wm.version = package.at("version").get<std::string>();
            wm.edition = package.at("edition").get<std::string>();
            wm.manifest_path = package.at("manifest_path").get<std::string>();
            md.members_.push_back(std::move(wm));

            for (const auto& target : package.at("targets")) {
                auto name = target.at("name").get<std::string>();
                auto kinds = target.at("kind").get<std::vector<std::string>>();
                auto kind = classify_target(kinds);
                if (!kind) {
                    log::trace("skipping target '%s' of %s (kind %s)",
                               name.c_str(), id.c_str(), target.at("kind").dump().c_str());
                    continue;
                }
                md.artifacts_.push_back(
                    Artifact{std::move(name), target.at("src_path").get<std::string>(), *kind});
            }
        }
    } catch (const json::exception& e) {
        return ManifoldError{ManifoldError::Parse,
            std::string("malformed cargo metadata: ") + e.what(),
            "", project_dir.string(), 0};
    }

    log::debug("cargo metadata: %zu workspace member(s), %zu artifact(s)",
               md.members_.size(), md.artifacts_.size());

    md.data_ = std::move(data);
    return Result<CargoMetadata>::ok(std::move(md));
}

Result<CargoMetadata> CargoMetadata::parse(const std::filesystem::path& project_dir,
                                           const std::string& json_str) {
    json data;
    try {
        data = json::parse(json_str);
    } catch (const json::parse_error& e) {
        return ManifoldError{ManifoldError::Parse,
            std::string("cargo metadata JSON parse error: ") + e.what()};
    }
    return CargoMetadata::of(project_dir, std::move(data));
}

Result<CargoMetadata> CargoMetadata::read(const std::filesystem::path& project_dir,
                                          const CargoCli& cli) {
    auto output = cli.metadata(project_dir);
    if (output.is_err()) return std::move(output).error();

    auto md = CargoMetadata::parse(project_dir, output.value());
    if (md.is_err()) {
        return ManifoldError{ManifoldError::ExternalTool,
            cli.program() + " metadata produced unusable output",
            md.error().message};
    }
    return md;
}

const WorkspaceMember* CargoMetadata::find_member(const std::string& name) const {
    for (const auto& m : members_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::vector<Artifact> CargoMetadata::artifacts_of(ArtifactKind kind) const {
    std::vector<Artifact> out;
    for (const auto& a : artifacts_) {
        if (a.kind == kind) out.push_back(a);
    }
    return out;
}

} // namespace manifold
