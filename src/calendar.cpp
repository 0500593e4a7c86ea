#include "calendar.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <regex>

std::string CalendarDate::toIsoString() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

bool operator==(const CalendarDate& a, const CalendarDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

bool isValidDate(int year, int month, int day) {
  if (year < 1 || year > 9999) return false;
  if (month < 1 || month > 12) return false;
  return day >= 1 && day <= daysInMonth(year, month);
}

std::optional<CalendarDate> parseIsoDate(const std::string& text) {
  static const std::regex isoPattern("^([0-9]{4})-([0-9]{2})-([0-9]{2})$");
  std::smatch m;
  if (!std::regex_match(text, m, isoPattern)) return std::nullopt;
  CalendarDate date{std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str())};
  if (!isValidDate(date.year, date.month, date.day)) return std::nullopt;
  return date;
}

int currentCalendarYear() {
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  return local.tm_year + 1900;
}

int eraOffset(DateInterpretation interpretation) {
  switch (interpretation) {
    case DateInterpretation::Seireki: return kSeirekiOffset;
    case DateInterpretation::Heisei: return kHeiseiOffset;
    case DateInterpretation::Reiwa: return kReiwaOffset;
    case DateInterpretation::Showa: return kShowaOffset;
  }
  return kSeirekiOffset;
}

int toGregorianYear(int printedYear, DateInterpretation interpretation) {
  return eraOffset(interpretation) + printedYear;
}

const char* toString(DateInterpretation interpretation) {
  switch (interpretation) {
    case DateInterpretation::Seireki: return "seireki";
    case DateInterpretation::Heisei: return "heisei";
    case DateInterpretation::Reiwa: return "reiwa";
    case DateInterpretation::Showa: return "showa";
  }
  return "seireki";
}

std::optional<DateInterpretation> parseDateInterpretation(const std::string& text) {
  if (text == "seireki") return DateInterpretation::Seireki;
  if (text == "heisei") return DateInterpretation::Heisei;
  if (text == "reiwa") return DateInterpretation::Reiwa;
  if (text == "showa") return DateInterpretation::Showa;
  return std::nullopt;
}

std::string toWarekiDisplay(const CalendarDate& date) {
  char buf[32];
  if (date.year >= 2019) {
    std::snprintf(buf, sizeof(buf), "R%d/%02d/%02d", date.year - kReiwaOffset, date.month, date.day);
  } else if (date.year >= 1989) {
    std::snprintf(buf, sizeof(buf), "H%d/%02d/%02d", date.year - kHeiseiOffset, date.month, date.day);
  } else if (date.year >= 1926) {
    std::snprintf(buf, sizeof(buf), "S%d/%02d/%02d", date.year - kShowaOffset, date.month, date.day);
  } else {
    std::snprintf(buf, sizeof(buf), "%d/%02d/%02d", date.year, date.month, date.day);
  }
  return buf;
}
