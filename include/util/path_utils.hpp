#pragma once

#include <string>
#include <string_view>

namespace otasrv {

// True if the value could name something outside a single directory entry.
inline bool ContainsPathSeparator(std::string_view s) {
    return s.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos;
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
    std::string out(dir);
    if (out.empty()) return std::string(name);
    if (out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Percent-encode a query parameter value. Unreserved characters
// (RFC 3986) pass through; '+' is encoded so it is not read back as a space.
inline std::string EncodeQueryValue(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
                                c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0xF]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

} // namespace otasrv
