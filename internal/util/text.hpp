#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace engram::util {

// ASCII whitespace trim.
std::string Trim(std::string_view text);

// Lowercases ASCII, Latin-1, Latin Extended-A and Cyrillic in UTF-8 text.
// Other code points and malformed bytes pass through untouched.
std::string ToLower(std::string_view text);

// Removes embedded NUL characters.
std::string StripNul(std::string_view text);

/*
  Canonical form used for "same text" comparisons between versions:
  trimmed, internal whitespace runs collapsed to one space, then ToLower.
*/
std::string NormalizeText(std::string_view text);

bool IsBlank(std::string_view text);

// Whitespace-separated tokens, lowercased.
std::vector<std::string> Tokenize(std::string_view text);

/*
  Fraction of query tokens found as substrings of the candidate text,
  both case-folded. Empty query or empty text yields 0.
*/
double KeywordOverlap(std::string_view query, std::string_view text);

bool StartsWith(std::string_view text, std::string_view prefix);
bool Contains(std::string_view text, std::string_view needle);

std::string Join(const std::vector<std::string>& parts, std::string_view separator);

} // namespace engram::util
