#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace gb {

// Removes every code point that could reach the printer as a control code:
// ASCII C0 controls and DEL (newline excepted) and anything whose Unicode
// general category is C* (Cc, Cf, Cs, Co, Cn). Ill-formed UTF-8 is dropped.
// Everything else is copied through in order.
std::string sanitize(std::string_view utf8);

// Strips leading/trailing Unicode White_Space.
std::string trimWhitespace(std::string_view utf8);

// Number of code points; each ill-formed byte sequence counts as one.
std::size_t codePointCount(std::string_view utf8);

} // namespace gb
