#pragma once

#include <string>

namespace manifold {

struct ManifoldError {
    enum Code {
        IO,
        Parse,
        InvalidManifest,
        ExternalTool,
        Config,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ManifoldError() = default;
    ManifoldError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ManifoldError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ManifoldError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace manifold
