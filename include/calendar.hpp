#pragma once

#include <optional>
#include <string>

struct CalendarDate {
  int year;
  int month;
  int day;

  // YYYY-MM-DD
  std::string toIsoString() const;
};

bool operator==(const CalendarDate& a, const CalendarDate& b);

bool isLeapYear(int year);

// 0 for a month outside 1..12.
int daysInMonth(int year, int month);

// Strict validation, no clamping of days past the end of the month.
bool isValidDate(int year, int month, int day);

// Parses exactly "YYYY-MM-DD" and validates the date.
std::optional<CalendarDate> parseIsoDate(const std::string& text);

// Year from the system clock, local time.
int currentCalendarYear();

// How a two-digit printed year is read.
enum class DateInterpretation {
  Seireki,  // Gregorian, 2000 + y
  Heisei,   // 1988 + y
  Reiwa,    // 2018 + y
  Showa,    // 1925 + y
};

constexpr int kSeirekiOffset = 2000;
constexpr int kReiwaOffset = 2018;
constexpr int kHeiseiOffset = 1988;
constexpr int kShowaOffset = 1925;

int eraOffset(DateInterpretation interpretation);

// Four-digit Gregorian year for a printed year under the given reading.
int toGregorianYear(int printedYear, DateInterpretation interpretation);

const char* toString(DateInterpretation interpretation);

// Accepts the toString() names ("seireki", "heisei", "reiwa", "showa").
std::optional<DateInterpretation> parseDateInterpretation(const std::string& text);

// Era-prefixed display: R{n}/MM/DD, H{n}/MM/DD, S{n}/MM/DD, or YYYY/MM/DD before Showa.
std::string toWarekiDisplay(const CalendarDate& date);
