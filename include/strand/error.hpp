#pragma once

#include <string>

namespace strand {

// Every failure strand reports. Rendered by format() as
//   error[Code]: message
//     hint: ...
//     --> file:line
struct StrandError {
    enum Code {
        IO,              // filesystem or subprocess failure
        Parse,           // malformed TOML
        Version,         // bad version or constraint string
        Config,          // invalid option value, e.g. a malformed git URI
        Manifest,        // bad [package] or [dependencies] content
        Transport,       // clone/checkout/tag listing failed, never retried
        PackageNotFound, // no package marker at the checked-out path
        Validation,      // package content does not match the request
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    StrandError() = default;
    StrandError(Code c, std::string msg, std::string h = "",
                std::string f = "", int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    bool is(Code c) const { return code == c; }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace strand
