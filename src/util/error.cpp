#include <vermatch/error.hpp>

namespace vermatch {

const char* VermatchError::code_name(Code c) {
    switch (c) {
        case Empty:            return "Empty";
        case InvalidComponent: return "InvalidComponent";
        case IO:               return "IO";
        case Config:           return "Config";
        case NotFound:         return "NotFound";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

VermatchError VermatchError::invalid_component(size_t index, std::string text,
                                               std::string source) {
    VermatchError e{InvalidComponent,
        "invalid component '" + text + "' at position " +
        std::to_string(index) + " in '" + source + "'",
        "components are non-negative integers or '*'"};
    e.index = index;
    e.text = std::move(text);
    return e;
}

VermatchError& VermatchError::at(std::string f, int l) {
    if (file.empty()) {
        file = std::move(f);
        line = l;
    }
    return *this;
}

std::string VermatchError::format() const {
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

} // namespace vermatch
