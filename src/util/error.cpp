#include <kapla/error.hpp>

namespace kapla {

const char* KaplaError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Version:           return "Version";
        case Manifest:          return "Manifest";
        case Config:            return "Config";
        case Duplicate:         return "Duplicate";
        case UnknownDependency: return "UnknownDependency";
        case Cycle:             return "Cycle";
        case Selection:         return "Selection";
        case NotFound:          return "NotFound";
        case Action:            return "Action";
        case Invariant:         return "Invariant";
        case InvalidArg:        return "InvalidArg";
    }
    return "Unknown";
}

std::string KaplaError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace kapla
