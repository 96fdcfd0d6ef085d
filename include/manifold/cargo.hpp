#pragma once

#include <manifold/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace manifold {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Blocks until the child exits. A timeout_seconds of 0 waits forever.
// Returns error on pipe/fork failure or timeout; a missing executable
// shows up as exit code 127.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 0);

// Wrapper around the cargo CLI
class CargoCli {
public:
    CargoCli() = default;
    explicit CargoCli(std::string program) : program_(std::move(program)) {}

    // Argument vector for `cargo metadata` on the manifest in project_dir
    std::vector<std::string> metadata_args(const std::filesystem::path& project_dir) const;

    // `cargo metadata --no-deps --format-version=1 --manifest-path <dir>/Cargo.toml`
    // Returns the JSON printed on stdout. Every failure (tool missing,
    // non-zero exit, empty output) is reported as ExternalTool.
    Result<std::string> metadata(const std::filesystem::path& project_dir) const;

    const std::string& program() const { return program_; }
    void set_program(std::string program) { program_ = std::move(program); }

    const std::string& manifest_name() const { return manifest_name_; }
    void set_manifest_name(std::string name) { manifest_name_ = std::move(name); }

private:
    std::string program_ = "cargo";
    std::string manifest_name_ = "Cargo.toml";
};

} // namespace manifold
