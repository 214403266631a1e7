#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstdio>


namespace lcr {
namespace json {

// Append s as a quoted JSON string literal
inline void append_string(std::string& out, std::string_view s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// 17 significant digits: reads back to the same double
inline void append(std::string& out, double value) {
    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf), "%.17g", value);
    if (n > 0) {
        out.append(buf, static_cast<std::size_t>(n));
    }
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// "key":
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out.push_back(':');
}

} // namespace json
} // namespace lcr
