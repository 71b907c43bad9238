#include <workon/error.hpp>

namespace workon {

const char* WorkonError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Resolution: return "Resolution";
        case GitBackend: return "GitBackend";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
        case Unsafe:     return "Unsafe";
    }
    return "Unknown";
}

std::string WorkonError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace workon
