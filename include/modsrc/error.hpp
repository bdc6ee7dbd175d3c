#pragma once

#include <string>

namespace modsrc {

struct ModsrcError {
    enum Code {
        UnsupportedSource,
        InvalidSource,
        IO,
        Parse,
        Config,
        Manifest,
        Duplicate,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string input;   // offending raw input, if any
    std::string cause;   // underlying failure this error wraps

    ModsrcError() = default;
    ModsrcError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ModsrcError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Source errors always carry the raw string that failed
    static ModsrcError source(Code c, std::string msg, std::string raw,
                              std::string cause = "");

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace modsrc
