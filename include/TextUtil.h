#pragma once
#include <string>
#include <algorithm>
#include <cctype>
#include <cstddef>

// Trim ASCII whitespace (including \r from CRLF tool output).
inline std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Length of the UTF-8 sequence introduced by lead byte c, 0 if c is not a valid lead byte.
inline size_t utf8_sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return c >= 0xC2 ? 2 : 0;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return c <= 0xF4 ? 4 : 0;
    return 0;
}

// Replace malformed UTF-8 with U+FFFD; an incomplete sequence at the very end
// (cut off by a byte limit) is dropped instead.
inline std::string sanitize_utf8(const std::string& in) {
    static const std::string REPLACEMENT = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        unsigned char c = static_cast<unsigned char>(in[i]);
        size_t len = utf8_sequence_length(c);
        if (len == 0) { out += REPLACEMENT; ++i; continue; }
        if (i + len > in.size()) {
            bool valid_prefix = true;
            for (size_t k = i + 1; k < in.size(); ++k)
                if ((static_cast<unsigned char>(in[k]) & 0xC0) != 0x80) valid_prefix = false;
            if (valid_prefix) break;
            out += REPLACEMENT; ++i; continue;
        }
        bool ok = true;
        for (size_t k = 1; k < len; ++k)
            if ((static_cast<unsigned char>(in[i + k]) & 0xC0) != 0x80) { ok = false; break; }
        if (!ok) { out += REPLACEMENT; ++i; continue; }
        out.append(in, i, len);
        i += len;
    }
    return out;
}

// Cut to at most max_bytes without splitting a UTF-8 sequence.
inline std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

// Collapse runs of whitespace into single spaces.
inline std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}
