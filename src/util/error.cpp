#include <stackup/error.hpp>

namespace stackup {

const char* StackupError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case Version:             return "Version";
        case Config:              return "Config";
        case NoProjectFound:      return "NoProjectFound";
        case NoManifestFound:     return "NoManifestFound";
        case ManifestNotFound:    return "ManifestNotFound";
        case ExternalToolMissing: return "ExternalToolMissing";
        case Spawn:               return "Spawn";
        case NotFound:            return "NotFound";
        case InvalidArg:          return "InvalidArg";
        case Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

std::string StackupError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!path.empty()) {
        result += "\n  --> ";
        result += path;
    }

    return result;
}

} // namespace stackup
