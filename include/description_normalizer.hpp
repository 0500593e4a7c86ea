#pragma once

#include <string>

// Cleans a transaction description for display and export:
//   NFKC (full-width ASCII folded, half-width katakana widened),
//   ":selected:" markers dropped,
//   branch-number prefixes (取扱店 51317, 店番 ...) and a leading
//   4-5 digit post-office branch number removed,
//   katakana abbreviations expanded (ﾌﾘｺﾐ -> 振込, ﾐｽﾞﾎ -> みずほ, ...),
//   numeric brackets "(123)" removed,
//   "RT ... ペイペイ" -> "RT (ペイペイ)", payment words -> "払込み",
//   card rows -> "カード".
std::string normalizeDescription(const std::string& raw);
