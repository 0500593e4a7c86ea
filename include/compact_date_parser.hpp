#pragma once

#include "calendar.hpp"

#include <optional>
#include <string>
#include <vector>

// A date read from a row, before any contextual year resolution.
struct RowDate {
  int printedYear = 0;
  int yearDigits = 0;
  int month = 0;
  int day = 0;
  // Set when the token carried an era prefix (R/H/S, 令/平/昭).
  std::optional<DateInterpretation> era;
  // Reading under the static era table. Absent when that year lacks the day
  // (06-02-29 is Heisei 6, not a leap year) but another era reading has it.
  std::optional<CalendarDate> simple;
};

struct RowDateMatch {
  RowDate date;
  // Row tokens the date did not consume, in order.
  std::vector<std::string> remainder;
};

// Static two-digit-year table used inside row assembly:
//   4-digit 1900..2099 literal, 32..64 Showa, 6..31 Heisei, 1..5 Reiwa,
//   anything else 2000 + y. Three-digit years are never valid.
std::optional<int> simpleTableYear(int printedYear, int yearDigits);

// Reads a date from one candidate: either already-separated digit groups
// (y, m, d) or a run of digits split as year {4,3,2} x month {2,1}.
std::optional<RowDate> parseDateDigits(const std::vector<std::string>& groups,
                                       std::optional<DateInterpretation> era = std::nullopt);

// Finds the first date in a row's tokens. Digit groups are collected from
// consecutive date-like tokens until there are three groups or six digits;
// shorter runs are never read as dates.
std::optional<RowDateMatch> parseRowDate(const std::vector<std::string>& tokens);
