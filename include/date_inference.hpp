#pragma once

#include "calendar.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

// Which rule of the cascade produced a year.
enum class InferenceMethod {
  DefiniteSeireki,   // printed year >= 32
  DefiniteWareki,    // era printed next to the year
  HighProbHeisei,    // 8..31, or past the current Reiwa year
  ContextBased,      // neighbouring dates in the same document
  BankLookup,        // known bank convention
  UserConfirmed,     // learned or confirmed format
  DefaultReiwa,      // fallback for 0..current Reiwa year
};

const char* toString(InferenceMethod method);

struct DateAlternative {
  int year;
  DateInterpretation interpretation;
};

struct DateInferenceResult {
  int year = 0;
  int month = 0;
  int day = 0;
  double confidence = 0.0;
  InferenceMethod method = InferenceMethod::DefaultReiwa;
  bool isAmbiguous = false;
  int originalYearDigits = 2;
  std::vector<DateAlternative> alternatives;

  CalendarDate date() const { return CalendarDate{year, month, day}; }

  // YYYY-MM-DD
  std::string toIsoDate() const;

  // R6/12/25, H30/05/01, S60/01/15
  std::string toWarekiDisplay() const;
};

struct DateInferenceContext {
  std::optional<std::string> bankCode;
  std::optional<std::string> bankName;
  // Two-digit-year dates of the whole document ("yy-mm-dd"), in document order.
  std::vector<std::string> surroundingDates;
  std::optional<size_t> currentIndex;
  std::optional<DateInterpretation> userConfirmedFormat;
};

struct TwoDigitDate {
  int year;
  int month;
  int day;
};

// Year convention a bank prints in its passbooks.
enum class BankYearStyle {
  Seireki,
  Wareki,
};

struct KnownBank {
  const char* code;
  const char* name;
  BankYearStyle style;
};

// Banks whose passbook year convention is known up front.
const std::vector<KnownBank>& knownBanks();

std::optional<BankYearStyle> knownBankStyle(const std::string& bankCode);

std::optional<std::string> bankCodeForName(const std::string& bankName);

// Bank code -> confirmed interpretation. One table per caller/session; not
// safe for concurrent learn() calls on the same instance.
class LearnedBankFormats {
public:
  void learn(const std::string& bankCode, DateInterpretation interpretation);

  std::optional<DateInterpretation> lookup(const std::string& bankCode) const;

  const std::map<std::string, DateInterpretation>& entries() const { return m_formats; }

private:
  std::map<std::string, DateInterpretation> m_formats;
};

// Resolves two-digit passbook years to Gregorian years.
//
// Cascade, first match wins:
//   1. y >= 32                      -> 2000 + y
//   2. confirmed format / bank code -> learned table, then known banks
//   3. 8 <= y <= 31                 -> Heisei
//   4. 1 <= y <= 7 with neighbours  -> whichever era fits the confirmed years
//   5. otherwise                    -> Reiwa up to the current Reiwa year, else Heisei
class DateInferenceEngine {
public:
  static constexpr int kDefiniteSeirekiThreshold = 32;
  static constexpr int kHighProbHeiseiMin = 8;
  static constexpr int kAmbiguousMax = 7;
  static constexpr int kContextSlackYears = 5;

  explicit DateInferenceEngine(LearnedBankFormats& learned);
  DateInferenceEngine(LearnedBankFormats& learned, int currentYear);

  DateInferenceResult inferDate(int twoDigitYear, int month, int day,
                                const DateInferenceContext& context = DateInferenceContext()) const;

  // Shares one document-wide context across all dates: every call sees the
  // full list as surroundingDates and its own position as currentIndex.
  std::vector<DateInferenceResult> inferDatesBatch(const std::vector<TwoDigitDate>& dates,
                                                   DateInferenceContext context = DateInferenceContext()) const;

  void learnBankFormat(const std::string& bankCode, DateInterpretation interpretation);

  std::map<std::string, DateInterpretation> learnedFormats() const;

  int currentReiwaYear() const { return m_currentYear - kReiwaOffset; }

  // Result for a year whose era is already fixed.
  static DateInferenceResult fromInterpretation(int twoDigitYear, int month, int day,
                                                DateInterpretation interpretation,
                                                InferenceMethod method, double confidence);

private:
  std::optional<DateInferenceResult> inferFromBankCode(int twoDigitYear, int month, int day,
                                                       const std::string& bankCode) const;
  std::optional<DateInferenceResult> inferFromContext(int twoDigitYear, int month, int day,
                                                      const DateInferenceContext& context) const;
  DateInferenceResult highProbHeisei(int twoDigitYear, int month, int day) const;
  DateInferenceResult defaultResult(int twoDigitYear, int month, int day) const;

  LearnedBankFormats& m_learned;
  int m_currentYear;
};

// Formats a two-digit-year date the way surroundingDates expects it.
std::string formatTwoDigitDate(const TwoDigitDate& date);
