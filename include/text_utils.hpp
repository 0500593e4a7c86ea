#pragma once

#include <string>
#include <vector>

// UTF-8 to UTF-32 conversion. Malformed bytes decode to U+FFFD.
std::u32string utf8ToUtf32(const std::string& utf8);

// UTF-32 to UTF-8 conversion.
std::string utf32ToUtf8(const std::u32string& utf32);

std::string trim(const std::string& s);

// Splits on ASCII whitespace, dropping empty pieces.
std::vector<std::string> splitWhitespace(const std::string& s);

std::string joinWithSpace(const std::vector<std::string>& parts);

void replaceAll(std::string& s, const std::string& from, const std::string& to);

bool endsWith(const std::string& s, const std::string& suffix);

// True for a non-empty string of ASCII digits only.
bool isAsciiDigits(const std::string& s);

// Hiragana, katakana (full and half width), CJK ideographs and the iteration mark.
bool isKanjiOrKana(char32_t cp);

// Kanji/kana or an ASCII letter.
bool isNameChar(char32_t cp);

// Unicode NFKC: full-width ASCII and U+3000 fold to ASCII, half-width
// katakana widen and voiced marks compose (ｶｰﾄﾞ -> カード). Input that is
// not valid UTF-8 comes back unchanged.
std::string toNfkc(const std::string& s);

// Number of code points in a UTF-8 string.
size_t codePointLength(const std::string& s);
