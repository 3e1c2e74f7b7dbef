#pragma once

#include <string>

namespace reclint {

struct ReclintError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Process,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ReclintError() = default;
    ReclintError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ReclintError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ReclintError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Config and NotFound abort a whole run; everything else is scoped
    // to the directory or file that produced it.
    bool is_fatal() const { return code == Config || code == NotFound; }
};

} // namespace reclint
