#pragma once

#include <optional>
#include <string>
#include <vector>

struct PassbookMetadata {
  std::optional<std::string> ownerName;
  std::optional<std::string> accountNumber;
  std::optional<std::string> branchName;
};

// Branch stem, without the 支店 suffix ("新宿支店" -> "新宿"). Tries a
// kanji/kana run directly before 支店, then the rest of a 支店 line, then
// walks back from that line to the nearest plausible stem.
std::optional<std::string> extractBranchName(const std::vector<std::string>& lines);

// 6-10 digit run within five lines after an account label (口座番号, 店番号,
// 座番号), preferring 7-8 digits, else the longest; falls back to the first
// 6-10 digit run anywhere.
std::optional<std::string> extractAccountNumber(const std::vector<std::string>& lines);

// Holder name: "<name> サマ", or the longest line ending in 様/サマ/さま,
// or the value after a 非会員 marker or a 氏名/名義人 label.
std::optional<std::string> extractOwnerName(const std::vector<std::string>& lines);

PassbookMetadata extractMetadata(const std::vector<std::string>& lines);
