#include <catch2/catch.hpp>
#include <manifold/metadata.hpp>

#include <fstream>
#include <sstream>

using namespace manifold;
using json = nlohmann::json;

static std::string fixture_dir() {
    const char* src = std::getenv("MANIFOLD_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::string load_fixture(const std::string& name) {
    std::ifstream in(fixture_dir() + "/" + name);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static json target(const std::string& name, std::vector<std::string> kinds) {
    return json{{"name", name}, {"src_path", "src/" + name + ".rs"}, {"kind", kinds}};
}

static json package(const std::string& id, const std::string& name, json targets) {
    return json{
        {"id", id},
        {"name", name},
        {"version", "0.1.0"},
        {"edition", "2021"},
        {"manifest_path", "/work/" + name + "/Cargo.toml"},
        {"targets", std::move(targets)},
    };
}

// ===== Classification =====

TEST_CASE("bin and lib targets become artifacts in order", "[metadata]") {
    json data{
        {"packages", json::array({
            package("app 0.1.0", "app", json::array({
                target("app", {"bin"}),
                target("app_lib", {"lib"}),
                target("demo", {"example"}),
            })),
        })},
        {"workspace_members", json::array({"app 0.1.0"})},
    };

    auto r = CargoMetadata::of("/work/app", data);
    REQUIRE(r.is_ok());
    const auto& arts = r.value().artifacts();
    REQUIRE(arts.size() == 2);
    REQUIRE(arts[0].name == "app");
    REQUIRE(arts[0].kind == ArtifactKind::Binary);
    REQUIRE(arts[0].path == "src/app.rs");
    REQUIRE(arts[1].name == "app_lib");
    REQUIRE(arts[1].kind == ArtifactKind::Library);
}

TEST_CASE("crate-type kinds without a lib tag are skipped", "[metadata]") {
    json data{
        {"packages", json::array({
            package("p", "p", json::array({
                target("p_dylib", {"cdylib", "rlib"}),
                target("p_lib", {"rlib", "lib"}),
                target("p_both", {"lib", "bin"}),
            })),
        })},
        {"workspace_members", json::array({"p"})},
    };

    auto r = CargoMetadata::of("/work/p", data);
    REQUIRE(r.is_ok());
    const auto& arts = r.value().artifacts();
    REQUIRE(arts.size() == 2);
    REQUIRE(arts[0].name == "p_lib");
    REQUIRE(arts[0].kind == ArtifactKind::Library);
    // "bin" is checked before "lib"
    REQUIRE(arts[1].name == "p_both");
    REQUIRE(arts[1].kind == ArtifactKind::Binary);
}

TEST_CASE("non-member packages contribute nothing", "[metadata]") {
    json data{
        {"packages", json::array({
            package("dep 1.0.0", "dep", json::array({target("dep", {"lib"})})),
            package("app 0.1.0", "app", json::array({target("app", {"bin"})})),
        })},
        {"workspace_members", json::array({"app 0.1.0", "ghost 0.0.1"})},
    };

    auto r = CargoMetadata::of("/work/app", data);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().workspace_members().size() == 1);
    REQUIRE(r.value().workspace_members()[0].name == "app");
    REQUIRE(r.value().artifacts().size() == 1);
    REQUIRE(r.value().artifacts()[0].name == "app");
    REQUIRE(r.value().find_member("dep") == nullptr);
    REQUIRE(r.value().find_member("ghost") == nullptr);
}

// ===== Fixture =====

TEST_CASE("parse workspace metadata fixture", "[metadata]") {
    auto r = CargoMetadata::parse("/work/kiln", load_fixture("metadata_workspace.json"));
    REQUIRE(r.is_ok());
    auto& md = r.value();

    REQUIRE(md.project_dir() == "/work/kiln");
    REQUIRE(md.raw()["target_directory"] == "/work/kiln/target");

    const auto& members = md.workspace_members();
    REQUIRE(members.size() == 2);
    REQUIRE(members[0].name == "kiln-core");
    REQUIRE(members[0].id == "path+file:///work/kiln/crates/core#kiln-core@1.4.0");
    REQUIRE(members[0].version == "1.4.0");
    REQUIRE(members[0].edition == "2021");
    REQUIRE(members[0].manifest_path == "/work/kiln/crates/core/Cargo.toml");
    REQUIRE(members[1].name == "kiln");

    const auto& arts = md.artifacts();
    REQUIRE(arts.size() == 3);
    REQUIRE(arts[0].name == "kiln_core");
    REQUIRE(arts[0].kind == ArtifactKind::Library);
    REQUIRE(arts[1].name == "kiln");
    REQUIRE(arts[1].path == "/work/kiln/crates/cli/src/main.rs");
    REQUIRE(arts[2].name == "kiln-dump");

    REQUIRE(md.artifacts_of(ArtifactKind::Binary).size() == 2);
    REQUIRE(md.artifacts_of(ArtifactKind::Library).size() == 1);

    auto* cli = md.find_member("kiln");
    REQUIRE(cli != nullptr);
    REQUIRE(cli->manifest_path == "/work/kiln/crates/cli/Cargo.toml");
}

TEST_CASE("empty workspace", "[metadata]") {
    auto r = CargoMetadata::parse("/w", R"({"packages": [], "workspace_members": []})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().workspace_members().empty());
    REQUIRE(r.value().artifacts().empty());
}

// ===== Errors =====

TEST_CASE("malformed JSON is a parse error", "[metadata]") {
    auto r = CargoMetadata::parse("/w", "{\"packages\": [");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ManifoldError::Parse);
}

TEST_CASE("missing required fields are a parse error", "[metadata]") {
    SECTION("no packages") {
        auto r = CargoMetadata::parse("/w", R"({"workspace_members": []})");
        REQUIRE(r.error().code == ManifoldError::Parse);
    }
    SECTION("member package without targets") {
        auto r = CargoMetadata::parse("/w", R"({
            "packages": [{"id": "a", "name": "a", "version": "1", "edition": "2021",
                          "manifest_path": "/w/Cargo.toml"}],
            "workspace_members": ["a"]})");
        REQUIRE(r.error().code == ManifoldError::Parse);
    }
    SECTION("kind is not a list") {
        auto r = CargoMetadata::parse("/w", R"({
            "packages": [{"id": "a", "name": "a", "version": "1", "edition": "2021",
                          "manifest_path": "/w/Cargo.toml",
                          "targets": [{"name": "a", "src_path": "x", "kind": "bin"}]}],
            "workspace_members": ["a"]})");
        REQUIRE(r.error().code == ManifoldError::Parse);
    }
}

// ===== Artifact =====

TEST_CASE("artifact to_json", "[metadata]") {
    Artifact a{"kiln", "src/main.rs", ArtifactKind::Binary};
    REQUIRE(a.to_json() == json{{"name", "kiln"}, {"path", "src/main.rs"}, {"kind", "bin"}});
    REQUIRE(std::string(artifact_kind_name(ArtifactKind::Library)) == "lib");
}
