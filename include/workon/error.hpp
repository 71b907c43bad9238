#pragma once

#include <string>

namespace workon {

struct WorkonError {
    enum Code {
        IO,
        Parse,
        Config,
        Resolution,
        GitBackend,
        NotFound,
        InvalidArg,
        Unsafe
    };

    Code code;
    std::string message;
    std::string hint;

    WorkonError() = default;
    WorkonError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WorkonError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace workon
