#include "text_utils.hpp"

#include <utf8proc.h>

#include <cctype>
#include <cstdlib>
#include <memory>
#include <utility>

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// utf8proc_map() allocates with malloc.
struct Utf8ProcDeleter {
  void operator()(utf8proc_uint8_t* p) const noexcept { std::free(p); }
};

} // namespace

std::u32string utf8ToUtf32(const std::string& utf8) {
  std::u32string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char c = static_cast<unsigned char>(utf8[i]);
    char32_t cp = 0;
    size_t extra = 0;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F; extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F; extra = 2;
    } else if ((c & 0xF8) == 0xF0) {
      cp = c & 0x07; extra = 3;
    } else {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }
    bool ok = true;
    for (size_t k = 1; k <= extra; ++k) {
      if (i + k >= utf8.size()) { ok = false; break; }
      unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

std::string utf32ToUtf8(const std::u32string& utf32) {
  std::string out;
  out.reserve(utf32.size());
  for (char32_t cp : utf32) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::vector<std::string> splitWhitespace(const std::string& s) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : s) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!current.empty()) parts.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) parts.push_back(std::move(current));
  return parts;
}

std::string joinWithSpace(const std::vector<std::string>& parts) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += ' ';
    out += parts[i];
  }
  return out;
}

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isAsciiDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char ch : s) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
  }
  return true;
}

bool isKanjiOrKana(char32_t cp) {
  return (cp >= 0x3040 && cp <= 0x309F)    // hiragana
      || (cp >= 0x30A0 && cp <= 0x30FF)    // katakana
      || (cp >= 0xFF66 && cp <= 0xFF9F)    // half-width katakana
      || (cp >= 0x4E00 && cp <= 0x9FFF)    // CJK unified ideographs
      || (cp >= 0x3400 && cp <= 0x4DBF)    // extension A
      || cp == 0x3005;                     // 々
}

bool isNameChar(char32_t cp) {
  if (isKanjiOrKana(cp)) return true;
  return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z');
}

std::string toNfkc(const std::string& s) {
  utf8proc_uint8_t* raw = nullptr;
  const auto options = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_COMPAT);
  const utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(s.data()),
                                            static_cast<utf8proc_ssize_t>(s.size()), &raw, options);
  if (len < 0 || !raw) {
    // Not valid UTF-8; left for the callers' byte-level rules.
    return s;
  }
  std::unique_ptr<utf8proc_uint8_t, Utf8ProcDeleter> buffer(raw);
  return std::string(reinterpret_cast<const char*>(buffer.get()), static_cast<size_t>(len));
}

size_t codePointLength(const std::string& s) {
  size_t n = 0;
  for (char ch : s) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) n++;
  }
  return n;
}
