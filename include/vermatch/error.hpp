#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace vermatch {

struct VermatchError {
    enum Code {
        Empty,
        InvalidComponent,
        IO,
        Config,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // Set for InvalidComponent: zero-based component position and its text
    size_t index = 0;
    std::string text;

    VermatchError() = default;
    VermatchError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VermatchError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    VermatchError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static VermatchError invalid_component(size_t index, std::string text,
                                           std::string source);

    // Attach a source location unless one is already present
    VermatchError& at(std::string f, int l);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace vermatch
