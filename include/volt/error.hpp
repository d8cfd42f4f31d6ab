#pragma once

#include <string>

namespace volt {

struct VoltError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        // Lockfile validation failures
        Missing,
        InvalidType,
        Duplicate,
        DanglingRef,
        Filesystem,
        Ordering
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    VoltError() = default;
    VoltError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VoltError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    VoltError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // True for errors raised by the lockfile validation engine
    bool is_validation() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace volt
