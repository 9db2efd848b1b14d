#pragma once

#include <string>
#include <string_view>

namespace rl {

// Escape s for use inside a JSON string literal (quotes not included).
// Ill-formed UTF-8 is replaced with U+FFFD so the output is always valid UTF-8.
std::string json_escape(std::string_view s);

// Shortest round-trip form, always with a fractional part or exponent ("0.0", "0.0123")
std::string json_number(double v);

} // namespace rl
