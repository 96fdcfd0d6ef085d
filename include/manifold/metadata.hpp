#pragma once

#include <manifold/cargo.hpp>
#include <manifold/result.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace manifold {

enum class ArtifactKind {
    Binary,
    Library
};

// "bin" / "lib"
const char* artifact_kind_name(ArtifactKind kind);

// A build output of a workspace member, derived from `cargo metadata`
struct Artifact {
    std::string name;
    std::string path;
    ArtifactKind kind;

    nlohmann::json to_json() const;
};

struct WorkspaceMember {
    std::string id;
    std::string name;
    std::string version;
    std::string edition;
    std::filesystem::path manifest_path;
};

// Point-in-time view of `cargo metadata --no-deps` output
class CargoMetadata {
public:
    // Run cargo through `cli` and parse its output
    static Result<CargoMetadata> read(const std::filesystem::path& project_dir,
                                      const CargoCli& cli = CargoCli{});

    // Parse JSON text
    static Result<CargoMetadata> parse(const std::filesystem::path& project_dir,
                                       const std::string& json_str);

    // Extract members and artifacts from an already parsed document
    static Result<CargoMetadata> of(const std::filesystem::path& project_dir,
                                    nlohmann::json data);

    const std::filesystem::path& project_dir() const { return project_dir_; }
    const nlohmann::json& raw() const { return data_; }

    const std::vector<WorkspaceMember>& workspace_members() const { return members_; }
    const std::vector<Artifact>& artifacts() const { return artifacts_; }

    const WorkspaceMember* find_member(const std::string& name) const;
    std::vector<Artifact> artifacts_of(ArtifactKind kind) const;

private:
    std::filesystem::path project_dir_;
    nlohmann::json data_;
    std::vector<WorkspaceMember> members_;
    std::vector<Artifact> artifacts_;
};

} // namespace manifold
