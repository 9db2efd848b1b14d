#include "rl/json.hpp"

#include <cmath>
#include <cstdio>
#include <format>

namespace rl {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if ill-formed.
// `consumed` is the maximal ill-formed prefix to replace with a single U+FFFD.
size_t utf8_sequence(std::string_view s, size_t i, size_t& consumed) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    int need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) need = 1;
    else if (lead == 0xE0) { need = 2; lo = 0xA0; }
    else if (lead >= 0xE1 && lead <= 0xEC) need = 2;
    else if (lead == 0xED) { need = 2; hi = 0x9F; } // no surrogates
    else if (lead >= 0xEE && lead <= 0xEF) need = 2;
    else if (lead == 0xF0) { need = 3; lo = 0x90; }
    else if (lead >= 0xF1 && lead <= 0xF3) need = 3;
    else if (lead == 0xF4) { need = 3; hi = 0x8F; } // <= U+10FFFF
    else {
        consumed = 1;
        return 0;
    }

    size_t j = i + 1;
    for (int got = 0; got < need; ++got, ++j) {
        if (j >= s.size()) break;
        const unsigned char b = static_cast<unsigned char>(s[j]);
        const bool ok = got == 0 ? (b >= lo && b <= hi) : (b >= 0x80 && b <= 0xBF);
        if (!ok) break;
    }
    consumed = j - i;
    return consumed == static_cast<size_t>(need) + 1 ? consumed : 0;
}

} // namespace

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (size_t i = 0; i < s.size();) {
        const unsigned char uc = static_cast<unsigned char>(s[i]);
        if (uc >= 0x80) {
            // bodies from the server are not guaranteed to be UTF-8
            size_t consumed = 0;
            if (utf8_sequence(s, i, consumed) > 0) out.append(s.substr(i, consumed));
            else out += kReplacement;
            i += consumed;
            continue;
        }
        switch (char c = static_cast<char>(uc)) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (uc < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
                    out += buf;
                } else {
                    out += c;
                }
        }
        ++i;
    }
    return out;
}

std::string json_number(double v) {
    // JSON has no NaN/Infinity literals
    if (!std::isfinite(v)) return "null";
    std::string out = std::format("{}", v);
    if (out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
}

} // namespace rl
