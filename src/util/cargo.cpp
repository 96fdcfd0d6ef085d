#include <manifold/cargo.hpp>
#include <manifold/log.hpp>

#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace manifold {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return ManifoldError{ManifoldError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return ManifoldError{ManifoldError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return ManifoldError{ManifoldError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return ManifoldError{ManifoldError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);
                return ManifoldError{ManifoldError::IO,
                    "command timed out after " + std::to_string(timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return ManifoldError{ManifoldError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);  // 1ms
    }
}

// ---------------------------------------------------------------------------
// CargoCli
// ---------------------------------------------------------------------------

static std::string join_args(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& a : args) {
        if (!joined.empty()) joined += ' ';
        joined += a;
    }
    return joined;
}

static std::string first_line(const std::string& s) {
    auto nl = s.find('\n');
    return nl == std::string::npos ? s : s.substr(0, nl);
}

std::vector<std::string> CargoCli::metadata_args(const std::filesystem::path& project_dir) const {
    return {
        program_, "metadata", "--no-deps", "--format-version=1",
        "--manifest-path", (project_dir / manifest_name_).string(),
    };
}

Result<std::string> CargoCli::metadata(const std::filesystem::path& project_dir) const {
    auto args = metadata_args(project_dir);
    log::debug("running: %s", join_args(args).c_str());

    auto r = run_command(args);
    if (r.is_err()) {
        auto& e = r.error();
        return ManifoldError{ManifoldError::ExternalTool,
            "failed to run " + program_ + ": " + e.message};
    }

    const auto& cr = r.value();
    if (cr.exit_code == 127) {
        return ManifoldError{ManifoldError::ExternalTool,
            "'" + program_ + "' could not be executed",
            "is cargo installed and on PATH? set [cargo] program or $CARGO to override"};
    }
    if (cr.exit_code != 0) {
        return ManifoldError{ManifoldError::ExternalTool,
            program_ + " metadata exited with code " + std::to_string(cr.exit_code),
            first_line(cr.stderr_str)};
    }
    if (cr.stdout_str.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ManifoldError{ManifoldError::ExternalTool,
            program_ + " metadata produced no output"};
    }

    return Result<std::string>::ok(cr.stdout_str);
}

} // namespace manifold
