#include "compact_date_parser.hpp"

#include "text_utils.hpp"

#include <initializer_list>
#include <regex>
#include <utility>

namespace {

constexpr size_t kMinGroups = 3;
constexpr size_t kMinDigits = 6;
constexpr size_t kMaxCompactDigits = 8;

struct DateToken {
  std::optional<DateInterpretation> era;
  std::vector<std::string> groups;
};

std::optional<DateToken> readDateToken(const std::string& token) {
  static const std::regex dateLike("^(R|H|S|D|r|h|s|d|令|平|昭)?([0-9]+(?:[-/.][0-9]+)*)$");
  static const std::regex digits("[0-9]+");
  std::smatch m;
  if (!std::regex_match(token, m, dateLike)) return std::nullopt;

  DateToken out;
  const std::string prefix = m[1].str();
  if (prefix == "R" || prefix == "r" || prefix == "令") out.era = DateInterpretation::Reiwa;
  else if (prefix == "H" || prefix == "h" || prefix == "平") out.era = DateInterpretation::Heisei;
  else if (prefix == "S" || prefix == "s" || prefix == "昭") out.era = DateInterpretation::Showa;

  const std::string body = m[2].str();
  for (auto it = std::sregex_iterator(body.begin(), body.end(), digits); it != std::sregex_iterator(); ++it) {
    out.groups.push_back(it->str());
  }
  return out;
}

size_t digitCount(const std::vector<std::string>& groups) {
  size_t n = 0;
  for (const auto& g : groups) n += g.size();
  return n;
}

bool thresholdReached(const std::vector<std::string>& groups) {
  return groups.size() >= kMinGroups || digitCount(groups) >= kMinDigits;
}

// Any year a bare two-digit year could stand for.
bool someReadingIsValid(int printed, int month, int day) {
  for (int offset : {kSeirekiOffset, kReiwaOffset, kHeiseiOffset, kShowaOffset}) {
    if (isValidDate(offset + printed, month, day)) return true;
  }
  return false;
}

std::optional<RowDate> buildDate(const std::string& yearText, int month, int day,
                                 std::optional<DateInterpretation> era) {
  if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
  const int printed = std::stoi(yearText);
  const int digits = static_cast<int>(yearText.size());

  std::optional<int> year;
  if (era) {
    if (digits > 2) return std::nullopt;
    year = toGregorianYear(printed, *era);
  } else {
    year = simpleTableYear(printed, digits);
  }
  if (!year) return std::nullopt;
  const bool tableValid = isValidDate(*year, month, day);
  if (!tableValid && (era || digits > 2 || !someReadingIsValid(printed, month, day))) return std::nullopt;

  RowDate date;
  date.printedYear = printed;
  date.yearDigits = digits;
  date.month = month;
  date.day = day;
  date.era = era;
  if (tableValid) date.simple = CalendarDate{*year, month, day};
  return date;
}

std::optional<RowDate> parseGrouped(const std::vector<std::string>& groups,
                                    std::optional<DateInterpretation> era) {
  const std::string& y = groups[0];
  const std::string& m = groups[1];
  const std::string& d = groups[2];
  if (y.empty() || y.size() > 4 || m.empty() || m.size() > 2 || d.empty() || d.size() > 2) return std::nullopt;
  return buildDate(y, std::stoi(m), std::stoi(d), era);
}

std::optional<RowDate> parseCompact(const std::string& run, std::optional<DateInterpretation> era) {
  if (run.size() < 5 || run.size() > kMaxCompactDigits) return std::nullopt;
  for (size_t yearLen : {4, 3, 2}) {
    for (size_t monthLen : {2, 1}) {
      if (yearLen + monthLen >= run.size()) continue;
      const size_t dayLen = run.size() - yearLen - monthLen;
      if (dayLen > 2) continue;
      const std::string yearText = run.substr(0, yearLen);
      if (yearLen > 2 && yearText[0] == '0') continue;
      const int month = std::stoi(run.substr(yearLen, monthLen));
      const int day = std::stoi(run.substr(yearLen + monthLen, dayLen));
      if (auto date = buildDate(yearText, month, day, era)) return date;
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<int> simpleTableYear(int printedYear, int yearDigits) {
  if (yearDigits >= 4) {
    if (printedYear >= 1900 && printedYear <= 2099) return printedYear;
    return std::nullopt;
  }
  if (yearDigits == 3) return std::nullopt;
  if (printedYear >= 32 && printedYear <= 64) return kShowaOffset + printedYear;
  if (printedYear >= 6 && printedYear <= 31) return kHeiseiOffset + printedYear;
  if (printedYear >= 1 && printedYear <= 5) return kReiwaOffset + printedYear;
  return kSeirekiOffset + printedYear;
}

std::optional<RowDate> parseDateDigits(const std::vector<std::string>& groups,
                                       std::optional<DateInterpretation> era) {
  if (groups.empty()) return std::nullopt;
  if (groups.size() >= kMinGroups) {
    if (auto date = parseGrouped(groups, era)) return date;
  }
  std::string run;
  for (const auto& g : groups) run += g;
  return parseCompact(run, era);
}

std::optional<RowDateMatch> parseRowDate(const std::vector<std::string>& tokens) {
  // Pass 0 only accepts a token that carries a whole date by itself; pass 1
  // lets short tokens borrow digit groups from the tokens after them.
  for (int pass = 0; pass < 2; ++pass) {
    for (size_t start = 0; start < tokens.size(); ++start) {
      std::optional<DateToken> first = readDateToken(tokens[start]);
      if (!first) continue;

      std::vector<std::string> groups = first->groups;
      size_t end = start + 1;
      while (pass == 1 && !thresholdReached(groups) && end < tokens.size()) {
        std::optional<DateToken> next = readDateToken(tokens[end]);
        if (!next || next->era) break;
        groups.insert(groups.end(), next->groups.begin(), next->groups.end());
        ++end;
      }
      if (!thresholdReached(groups)) continue;
      if (pass == 1 && end == start + 1) continue;

      std::optional<RowDate> date = parseDateDigits(groups, first->era);
      if (!date) continue;

      RowDateMatch match;
      match.date = *date;
      for (size_t i = 0; i < tokens.size(); ++i) {
        if (i >= start && i < end) continue;
        match.remainder.push_back(tokens[i]);
      }
      return match;
    }
  }
  return std::nullopt;
}
