#pragma once

#include <cstdio>
#include <string>

namespace didlink::json {

    inline std::string escape(const std::string &str) {
        std::string result;
        result.reserve(str.size());
        for (char c : str) {
            switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
            }
        }
        return result;
    }

    /// Quoted and escaped JSON string literal
    inline std::string quote(const std::string &str) { return "\"" + escape(str) + "\""; }

} // namespace didlink::json
