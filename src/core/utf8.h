#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tomo::utf8
{
// Decodes the code point starting at `s[pos]`.
//
// On success returns true, stores the scalar in `out_cp` and the number of bytes
// consumed in `out_len`. On a malformed, overlong, surrogate or out-of-range
// sequence returns false and sets `out_len` to 1 so callers can resync.
bool DecodeAt(std::string_view s, std::size_t pos, char32_t& out_cp, std::size_t& out_len);

// Decodes the first code point of `s`; returns 0 if empty or malformed.
char32_t DecodeFirst(std::string_view s);

// Appends the UTF-8 encoding of `cp` to `out`.
// Invalid scalars (surrogates, > U+10FFFF) are encoded as U+FFFD.
void Append(char32_t cp, std::string& out);

std::string Encode(char32_t cp);

// Returns the number of code points in `s` if it is valid UTF-8, or -1.
long long CountCodePoints(std::string_view s);
} // namespace tomo::utf8
