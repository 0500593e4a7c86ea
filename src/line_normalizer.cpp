#include "line_normalizer.hpp"

#include "text_utils.hpp"

#include <utility>

namespace {

bool isSpaceCodePoint(char32_t cp) {
  return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v'
      || cp == 0x00A0 || cp == 0x3000;
}

// Returns the replacement for cp, 0 to drop it, or cp itself.
char32_t mapCodePoint(char32_t cp) {
  switch (cp) {
    case 0x2212:  // −
    case 0x2015:  // ―
    case 0x30FC:  // ー
    case 0x2013:  // –
    case 0x2014:  // —
    case 0xFF0D:  // －
      return U'-';
    case 0xFF0F:  // ／
      return U'/';
    case 0xFF1A:  // ：
    case 0xFF1B:  // ；
      return U'-';
    case 0x30FB:  // ・
    case 0xFF65:  // ･
    case U'*':
    case 0xFF0A:  // ＊
      return 0;
    default:
      return cp;
  }
}

bool cleanupOnce(std::string& s) {
  const std::string before = s;
  replaceAll(s, " -", "-");
  replaceAll(s, "- ", "-");
  replaceAll(s, "--", "-");
  replaceAll(s, " :", ":");
  replaceAll(s, " ,", ",");
  return s != before;
}

} // namespace

std::string normalizeLine(const std::string& line) {
  std::u32string in = utf8ToUtf32(line);
  std::u32string out;
  out.reserve(in.size());
  bool pendingSpace = false;
  for (char32_t cp : in) {
    if (isSpaceCodePoint(cp)) {
      pendingSpace = true;
      continue;
    }
    char32_t mapped = mapCodePoint(cp);
    if (mapped == 0) continue;
    if (pendingSpace && !out.empty()) out.push_back(U' ');
    pendingSpace = false;
    out.push_back(mapped);
  }

  std::string text = utf32ToUtf8(out);
  while (cleanupOnce(text)) {
  }
  return trim(text);
}

std::vector<std::string> normalizeLines(const std::vector<std::string>& lines) {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    std::string normalized = normalizeLine(line);
    if (!normalized.empty()) out.push_back(std::move(normalized));
  }
  return out;
}
