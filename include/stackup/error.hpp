#pragma once

#include <string>

namespace stackup {

struct StackupError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        NoProjectFound,
        NoManifestFound,
        ManifestNotFound,
        ExternalToolMissing,
        Spawn,
        NotFound,
        InvalidArg,
        Cancelled
    };

    Code code;
    std::string message;
    std::string hint;
    std::string path;

    StackupError() = default;
    StackupError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StackupError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    StackupError(Code c, std::string msg, std::string h, std::string p)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          path(std::move(p)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace stackup
