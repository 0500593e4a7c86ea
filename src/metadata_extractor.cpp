#include "metadata_extractor.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {

constexpr size_t kLookaheadLines = 5;
constexpr size_t kMaxStemLength = 20;

const std::string kBranchSuffix = "支店";

bool isPlaceholder(const std::string& text) {
  static const std::vector<std::string> kFillers = {
    "不明", "なし", "該当なし", "未設定", "※", "…",
  };
  const std::string t = trim(text);
  if (t.empty()) return true;
  if (std::find(kFillers.begin(), kFillers.end(), t) != kFillers.end()) return true;
  for (char ch : t) {
    if (ch != '-' && ch != '/' && ch != '.' && ch != ' ' && ch != ':' && ch != '_') return false;
  }
  return true;
}

bool hasNameChar(const std::string& text) {
  for (char32_t cp : utf8ToUtf32(text)) {
    if (isNameChar(cp)) return true;
  }
  return false;
}

// Digits and punctuation only.
bool isNumericOnly(const std::string& text) {
  return !trim(text).empty() && !hasNameChar(text);
}

std::string stripSeparators(const std::string& text) {
  std::string t = trim(text);
  while (!t.empty() && (t.front() == ':' || t.front() == '-' || t.front() == '/')) t = trim(t.substr(1));
  while (!t.empty() && (t.back() == ':' || t.back() == '-' || t.back() == '/')) t = trim(t.substr(0, t.size() - 1));
  return t;
}

bool isPlausibleStem(const std::string& text) {
  const std::string t = trim(text);
  return !isPlaceholder(t) && hasNameChar(t) && codePointLength(t) <= kMaxStemLength;
}

std::optional<std::string> branchByPattern(const std::vector<std::string>& lines) {
  static const std::vector<std::u32string> kLabelRuns = {U"取扱", U"取引", U"お取引"};
  const std::u32string suffix = utf8ToUtf32(kBranchSuffix);
  for (const auto& line : lines) {
    const std::u32string cps = utf8ToUtf32(line);
    size_t pos = cps.find(suffix);
    while (pos != std::u32string::npos) {
      size_t start = pos;
      while (start > 0 && isNameChar(cps[start - 1])) start--;
      std::u32string run = cps.substr(start, pos - start);
      if (!run.empty() && std::find(kLabelRuns.begin(), kLabelRuns.end(), run) == kLabelRuns.end()) {
        return utf32ToUtf8(run);
      }
      pos = cps.find(suffix, pos + suffix.size());
    }
  }
  return std::nullopt;
}

std::vector<std::string> digitRuns(const std::string& text) {
  std::vector<std::string> runs;
  std::string current;
  for (char ch : toNfkc(text)) {
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      current.push_back(ch);
    } else if (!current.empty()) {
      runs.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) runs.push_back(current);
  return runs;
}

std::string stripOwnerSuffix(const std::string& text) {
  static const std::vector<std::string> kSuffixes = {"様", "サマ", "さま"};
  std::string t = trim(text);
  for (const auto& suffix : kSuffixes) {
    if (endsWith(t, suffix)) return trim(t.substr(0, t.size() - suffix.size()));
  }
  return t;
}

bool isOwnerSkipToken(const std::string& text) {
  static const std::vector<std::string> kSkip = {
    "様", "サマ", "さま", "殿", "氏名", "名義人", "お名前", "フリガナ", "カナ", "非会員",
  };
  const std::string t = trim(text);
  return std::find(kSkip.begin(), kSkip.end(), t) != kSkip.end();
}

bool isOwnerValue(const std::string& text) {
  const std::string t = trim(text);
  return !t.empty() && !isOwnerSkipToken(t) && !isPlaceholder(t) && !isNumericOnly(t);
}

std::optional<std::string> ownerBySamaPattern(const std::vector<std::string>& lines) {
  const std::string marker = "サマ";
  for (const auto& line : lines) {
    const size_t pos = line.find(marker);
    if (pos == std::string::npos) continue;
    std::vector<std::string> tokens = splitWhitespace(line.substr(0, pos));
    if (tokens.empty()) continue;
    std::vector<std::string> name(tokens.size() > 2 ? tokens.end() - 2 : tokens.begin(), tokens.end());
    std::string candidate = joinWithSpace(name);
    if (isOwnerValue(candidate)) return candidate;
  }
  return std::nullopt;
}

std::optional<std::string> ownerBySuffixLine(const std::vector<std::string>& lines) {
  std::optional<std::string> best;
  for (const auto& line : lines) {
    const std::string t = trim(line);
    if (!(endsWith(t, "様") || endsWith(t, "サマ") || endsWith(t, "さま"))) continue;
    std::string candidate = stripOwnerSuffix(t);
    if (!isOwnerValue(candidate)) continue;
    if (!best || codePointLength(candidate) > codePointLength(*best)) best = candidate;
  }
  return best;
}

std::optional<std::string> ownerAfterLabel(const std::vector<std::string>& lines) {
  static const std::vector<std::string> kLabels = {"名義人", "氏名"};
  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    bool marker = line.find("非会員") != std::string::npos;
    std::string label;
    for (const auto& l : kLabels) {
      if (line.find(l) != std::string::npos) { label = l; break; }
    }
    if (!marker && label.empty()) continue;

    if (!label.empty()) {
      std::string rest = line.substr(line.find(label) + label.size());
      rest = stripOwnerSuffix(stripSeparators(rest));
      if (isOwnerValue(rest)) return rest;
    }
    const size_t last = std::min(lines.size() - 1, i + kLookaheadLines);
    for (size_t j = i + 1; j <= last; ++j) {
      std::string candidate = stripOwnerSuffix(lines[j]);
      if (isOwnerValue(candidate)) return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<std::string> extractBranchName(const std::vector<std::string>& lines) {
  if (auto direct = branchByPattern(lines)) return direct;

  for (size_t i = 0; i < lines.size(); ++i) {
    if (lines[i].find(kBranchSuffix) == std::string::npos) continue;
    std::string rest = lines[i];
    replaceAll(rest, kBranchSuffix + "名", "");
    replaceAll(rest, kBranchSuffix, "");
    rest = stripSeparators(rest);
    if (isPlausibleStem(rest)) return rest;

    for (size_t j = i; j > 0; --j) {
      const std::string prev = stripSeparators(lines[j - 1]);
      if (isPlaceholder(prev) || isNumericOnly(prev)) continue;
      if (isPlausibleStem(prev)) return prev;
    }
  }
  return std::nullopt;
}

std::optional<std::string> extractAccountNumber(const std::vector<std::string>& lines) {
  static const std::vector<std::string> kLabels = {"口座番号", "店番号", "座番号"};

  std::vector<std::string> candidates;
  for (size_t i = 0; i < lines.size(); ++i) {
    bool labelled = false;
    for (const auto& label : kLabels) {
      if (lines[i].find(label) != std::string::npos) { labelled = true; break; }
    }
    if (!labelled) continue;
    const size_t last = std::min(lines.size() - 1, i + kLookaheadLines);
    for (size_t j = i; j <= last; ++j) {
      for (const auto& run : digitRuns(lines[j])) {
        if (run.size() >= 6 && run.size() <= 10) candidates.push_back(run);
      }
    }
  }

  if (!candidates.empty()) {
    for (const auto& c : candidates) {
      if (c.size() == 7 || c.size() == 8) return c;
    }
    return *std::max_element(candidates.begin(), candidates.end(),
                             [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
  }

  static const std::regex anyRun("[0-9]{6,10}");
  for (const auto& line : lines) {
    const std::string folded = toNfkc(line);
    std::smatch m;
    if (std::regex_search(folded, m, anyRun)) return m.str();
  }
  return std::nullopt;
}

std::optional<std::string> extractOwnerName(const std::vector<std::string>& lines) {
  std::optional<std::string> byPattern = ownerBySamaPattern(lines);
  std::optional<std::string> bySuffix = ownerBySuffixLine(lines);
  if (bySuffix && (!byPattern || codePointLength(*bySuffix) >= codePointLength(*byPattern))) return bySuffix;
  if (byPattern) return byPattern;
  return ownerAfterLabel(lines);
}

PassbookMetadata extractMetadata(const std::vector<std::string>& lines) {
  PassbookMetadata meta;
  meta.ownerName = extractOwnerName(lines);
  meta.accountNumber = extractAccountNumber(lines);
  meta.branchName = extractBranchName(lines);
  return meta;
}
