#include "sr/json.hpp"

#include <format>

namespace sr {

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char uc : s) {
        switch (char c = static_cast<char>(uc)) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (uc < 0x20) out += std::format("\\u{:04x}", uc);
                else out += c;
        }
    }
    return out;
}

std::string json_string(std::string_view s) {
    return '"' + json_escape(s) + '"';
}

} // namespace sr
