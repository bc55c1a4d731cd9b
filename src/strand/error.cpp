#include <strand/error.hpp>

namespace strand {

const char* StrandError::code_name(Code c) {
    static const char* const names[] = {
        "IO", "Parse", "Version", "Config", "Manifest",
        "Transport", "PackageNotFound", "Validation", "InvalidArg",
    };
    auto i = static_cast<size_t>(c);
    return i < sizeof(names) / sizeof(names[0]) ? names[i] : "Unknown";
}

std::string StrandError::format() const {
    std::string out = std::string("error[") + code_name(code) + "]: " + message;
    if (!hint.empty()) out += "\n  hint: " + hint;
    if (file.empty()) return out;

    out += "\n  --> " + file;
    if (line > 0) out += ":" + std::to_string(line);
    return out;
}

} // namespace strand
