#include <volt/error.hpp>

namespace volt {

const char* VoltError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Config:      return "Config";
        case NotFound:    return "NotFound";
        case InvalidArg:  return "InvalidArg";
        case Missing:     return "Missing";
        case InvalidType: return "InvalidType";
        case Duplicate:   return "Duplicate";
        case DanglingRef: return "DanglingRef";
        case Filesystem:  return "Filesystem";
        case Ordering:    return "Ordering";
    }
    return "Unknown";
}

bool VoltError::is_validation() const {
    switch (code) {
        case Missing:
        case InvalidType:
        case Duplicate:
        case DanglingRef:
        case Filesystem:
        case Ordering:
            return true;
        default:
            return false;
    }
}

std::string VoltError::format() const {
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

} // namespace volt
