#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace roster::names {

/*
  Name normalization.

  Two raw names denote the same spelling exactly when their
  normalized forms are equal. Steps, in order:

    1. ASCII lowercase
    2. "last, first" -> "first last" (one comma, non-empty tail)
    3. drop honorific / generational tokens: dr mr mrs ms miss ii iii iv
    4. drop periods
    5. drop everything outside [a-z] and whitespace
    6. collapse whitespace, trim

  Pure and deterministic; safe to call from any pass.
*/
std::string NormalizeName(std::string_view raw);

// Space-separated tokens of a normalized name with length >= 2.
std::vector<std::string> MeaningfulParts(std::string_view normalized);

// Shorthand for MeaningfulParts(NormalizeName(raw)).size().
std::size_t CountMeaningfulParts(std::string_view raw);

std::string ToLowerAscii(std::string_view s);

// ToLowerAscii plus the uppercase letters of Latin-1 Supplement and
// Latin Extended-A (U+00C0..U+017F) in UTF-8. Other bytes pass through.
std::string FoldCase(std::string_view s);

// True when no ASCII letter in `s` is lowercase.
bool IsAllUpperAscii(std::string_view s);

// UTF-8 code points, not bytes.
std::size_t CodePointLength(std::string_view s);

std::string_view TrimAscii(std::string_view s);

} // namespace roster::names
