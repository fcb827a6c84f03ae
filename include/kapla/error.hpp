#pragma once

#include <string>
#include <vector>

namespace kapla {

struct KaplaError {
    enum Code {
        IO,
        Parse,
        Version,
        Manifest,
        Config,
        Duplicate,
        UnknownDependency,
        Cycle,
        Selection,
        NotFound,
        Action,
        Invariant,
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Offending names: duplicate package, {from, to}, cycle path,
    // {package, missing dependency}
    std::vector<std::string> subjects;

    KaplaError() = default;
    KaplaError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KaplaError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KaplaError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    KaplaError& with_subjects(std::vector<std::string> names) {
        subjects = std::move(names);
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace kapla
