#include <modsrc/error.hpp>

namespace modsrc {

ModsrcError ModsrcError::source(Code c, std::string msg, std::string raw,
                                std::string cause) {
    ModsrcError e{c, std::move(msg)};
    e.input = std::move(raw);
    e.cause = std::move(cause);
    return e;
}

const char* ModsrcError::code_name(Code c) {
    switch (c) {
        case UnsupportedSource: return "UnsupportedSource";
        case InvalidSource:     return "InvalidSource";
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Config:            return "Config";
        case Manifest:          return "Manifest";
        case Duplicate:         return "Duplicate";
        case InvalidArg:        return "InvalidArg";
    }
    return "Unknown";
}

std::string ModsrcError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!input.empty()) {
        result += "\n  input: ";
        result += input;
    }

    if (!cause.empty()) {
        result += "\n  caused by: ";
        result += cause;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace modsrc
