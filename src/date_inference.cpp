#include "date_inference.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace {

DateInferenceResult makeResult(int year, int month, int day, double confidence,
                               InferenceMethod method, bool ambiguous,
                               std::vector<DateAlternative> alternatives = {}) {
  DateInferenceResult r;
  r.year = year;
  r.month = month;
  r.day = day;
  r.confidence = confidence;
  r.method = method;
  r.isAmbiguous = ambiguous;
  r.originalYearDigits = 2;
  r.alternatives = std::move(alternatives);
  return r;
}

// Year a surrounding "yy-mm-dd" entry resolves to without any context, or
// nothing when its reading is itself ambiguous.
std::optional<int> confidentYear(const std::string& entry) {
  size_t end = 0;
  while (end < entry.size() && std::isdigit(static_cast<unsigned char>(entry[end]))) end++;
  if (end == 0) return std::nullopt;
  if (end > 2) return std::atoi(entry.substr(0, end).c_str());
  int y = std::atoi(entry.substr(0, end).c_str());
  if (y >= DateInferenceEngine::kDefiniteSeirekiThreshold) return kSeirekiOffset + y;
  if (y >= DateInferenceEngine::kHighProbHeiseiMin) return kHeiseiOffset + y;
  return std::nullopt;
}

} // namespace

const char* toString(InferenceMethod method) {
  switch (method) {
    case InferenceMethod::DefiniteSeireki: return "definite_seireki";
    case InferenceMethod::DefiniteWareki: return "definite_wareki";
    case InferenceMethod::HighProbHeisei: return "high_prob_heisei";
    case InferenceMethod::ContextBased: return "context_based";
    case InferenceMethod::BankLookup: return "bank_lookup";
    case InferenceMethod::UserConfirmed: return "user_confirmed";
    case InferenceMethod::DefaultReiwa: return "default_reiwa";
  }
  return "default_reiwa";
}

std::string DateInferenceResult::toIsoDate() const {
  return date().toIsoString();
}

std::string DateInferenceResult::toWarekiDisplay() const {
  return ::toWarekiDisplay(date());
}

const std::vector<KnownBank>& knownBanks() {
  static const std::vector<KnownBank> kBanks = {
    {"0001", "みずほ銀行", BankYearStyle::Seireki},
    {"2952", "中央労働金庫", BankYearStyle::Seireki},
    {"0005", "三菱UFJ銀行", BankYearStyle::Wareki},
    {"0009", "三井住友銀行", BankYearStyle::Wareki},
    {"0010", "りそな銀行", BankYearStyle::Wareki},
  };
  return kBanks;
}

std::optional<BankYearStyle> knownBankStyle(const std::string& bankCode) {
  for (const auto& bank : knownBanks()) {
    if (bankCode == bank.code) return bank.style;
  }
  return std::nullopt;
}

std::optional<std::string> bankCodeForName(const std::string& bankName) {
  if (bankName.empty()) return std::nullopt;
  for (const auto& bank : knownBanks()) {
    std::string name = bank.name;
    if (bankName == name || bankName.find(name) != std::string::npos) return std::string(bank.code);
  }
  return std::nullopt;
}

void LearnedBankFormats::learn(const std::string& bankCode, DateInterpretation interpretation) {
  m_formats[bankCode] = interpretation;
}

std::optional<DateInterpretation> LearnedBankFormats::lookup(const std::string& bankCode) const {
  auto it = m_formats.find(bankCode);
  if (it == m_formats.end()) return std::nullopt;
  return it->second;
}

std::string formatTwoDigitDate(const TwoDigitDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d-%02d-%02d", date.year, date.month, date.day);
  return buf;
}

DateInferenceEngine::DateInferenceEngine(LearnedBankFormats& learned)
  : m_learned(learned), m_currentYear(currentCalendarYear()) {}

DateInferenceEngine::DateInferenceEngine(LearnedBankFormats& learned, int currentYear)
  : m_learned(learned), m_currentYear(currentYear) {}

DateInferenceResult DateInferenceEngine::inferDate(int twoDigitYear, int month, int day,
                                                   const DateInferenceContext& context) const {
  if (twoDigitYear >= kDefiniteSeirekiThreshold) {
    return makeResult(kSeirekiOffset + twoDigitYear, month, day, 1.0,
                      InferenceMethod::DefiniteSeireki, false);
  }

  if (context.userConfirmedFormat) {
    return fromInterpretation(twoDigitYear, month, day, *context.userConfirmedFormat,
                              InferenceMethod::UserConfirmed, 0.95);
  }

  std::optional<std::string> bankCode = context.bankCode;
  if (!bankCode && context.bankName) bankCode = bankCodeForName(*context.bankName);
  if (bankCode && !bankCode->empty()) {
    if (auto r = inferFromBankCode(twoDigitYear, month, day, *bankCode)) return *r;
  }

  if (twoDigitYear >= kHighProbHeiseiMin) {
    return highProbHeisei(twoDigitYear, month, day);
  }

  if (twoDigitYear >= 1 && twoDigitYear <= kAmbiguousMax && !context.surroundingDates.empty()) {
    if (auto r = inferFromContext(twoDigitYear, month, day, context)) return *r;
  }

  return defaultResult(twoDigitYear, month, day);
}

std::vector<DateInferenceResult> DateInferenceEngine::inferDatesBatch(const std::vector<TwoDigitDate>& dates,
                                                                      DateInferenceContext context) const {
  context.surroundingDates.clear();
  context.surroundingDates.reserve(dates.size());
  for (const auto& d : dates) context.surroundingDates.push_back(formatTwoDigitDate(d));

  std::vector<DateInferenceResult> results;
  results.reserve(dates.size());
  for (size_t i = 0; i < dates.size(); ++i) {
    context.currentIndex = i;
    results.push_back(inferDate(dates[i].year, dates[i].month, dates[i].day, context));
  }
  return results;
}

void DateInferenceEngine::learnBankFormat(const std::string& bankCode, DateInterpretation interpretation) {
  m_learned.learn(bankCode, interpretation);
}

std::map<std::string, DateInterpretation> DateInferenceEngine::learnedFormats() const {
  return m_learned.entries();
}

DateInferenceResult DateInferenceEngine::fromInterpretation(int twoDigitYear, int month, int day,
                                                            DateInterpretation interpretation,
                                                            InferenceMethod method, double confidence) {
  return makeResult(toGregorianYear(twoDigitYear, interpretation), month, day, confidence, method, false);
}

std::optional<DateInferenceResult> DateInferenceEngine::inferFromBankCode(int twoDigitYear, int month, int day,
                                                                          const std::string& bankCode) const {
  if (auto learned = m_learned.lookup(bankCode)) {
    return fromInterpretation(twoDigitYear, month, day, *learned, InferenceMethod::UserConfirmed, 0.95);
  }

  std::optional<BankYearStyle> style = knownBankStyle(bankCode);
  if (!style) return std::nullopt;

  switch (*style) {
    case BankYearStyle::Seireki: {
      int seireki = kSeirekiOffset + twoDigitYear;
      if (isValidDate(seireki, month, day)) {
        return makeResult(seireki, month, day, 0.9, InferenceMethod::BankLookup, false);
      }
      return std::nullopt;
    }
    case BankYearStyle::Wareki: {
      int reiwa = kReiwaOffset + twoDigitYear;
      int heisei = kHeiseiOffset + twoDigitYear;
      bool heiseiValid = isValidDate(heisei, month, day);
      if (twoDigitYear <= currentReiwaYear()) {
        bool reiwaValid = isValidDate(reiwa, month, day);
        if (reiwaValid && heiseiValid) {
          return makeResult(reiwa, month, day, 0.7, InferenceMethod::BankLookup, true,
                            {DateAlternative{heisei, DateInterpretation::Heisei}});
        }
        if (reiwaValid) {
          return makeResult(reiwa, month, day, 0.85, InferenceMethod::BankLookup, false);
        }
      }
      if (heiseiValid) {
        return makeResult(heisei, month, day, 0.85, InferenceMethod::BankLookup, false);
      }
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<DateInferenceResult> DateInferenceEngine::inferFromContext(int twoDigitYear, int month, int day,
                                                                         const DateInferenceContext& context) const {
  std::vector<std::optional<int>> resolved;
  resolved.reserve(context.surroundingDates.size());
  int minYear = 0;
  int maxYear = 0;
  bool any = false;
  for (const auto& entry : context.surroundingDates) {
    std::optional<int> y = confidentYear(entry);
    resolved.push_back(y);
    if (!y) continue;
    if (!any) {
      minYear = maxYear = *y;
      any = true;
    } else {
      minYear = std::min(minYear, *y);
      maxYear = std::max(maxYear, *y);
    }
  }
  if (!any) return std::nullopt;

  const int reiwa = kReiwaOffset + twoDigitYear;
  const int heisei = kHeiseiOffset + twoDigitYear;
  const int low = minYear - kContextSlackYears;
  const int high = maxYear + kContextSlackYears;
  const bool reiwaFits = reiwa >= low && reiwa <= high;
  const bool heiseiFits = heisei >= low && heisei <= high;

  std::optional<DateInterpretation> chosen;
  if (reiwaFits && !heiseiFits) {
    chosen = DateInterpretation::Reiwa;
  } else if (heiseiFits && !reiwaFits) {
    chosen = DateInterpretation::Heisei;
  } else if (reiwaFits && heiseiFits && context.currentIndex) {
    // Tie: nearest resolved year before this one in document order.
    size_t i = std::min(*context.currentIndex, resolved.size());
    while (i > 0) {
      --i;
      if (!resolved[i]) continue;
      int reiwaDiff = std::abs(reiwa - *resolved[i]);
      int heiseiDiff = std::abs(heisei - *resolved[i]);
      if (reiwaDiff < heiseiDiff) chosen = DateInterpretation::Reiwa;
      else if (heiseiDiff < reiwaDiff) chosen = DateInterpretation::Heisei;
      break;
    }
  }
  if (!chosen) return std::nullopt;
  if (!isValidDate(toGregorianYear(twoDigitYear, *chosen), month, day)) return std::nullopt;

  return fromInterpretation(twoDigitYear, month, day, *chosen, InferenceMethod::ContextBased, 0.8);
}

DateInferenceResult DateInferenceEngine::highProbHeisei(int twoDigitYear, int month, int day) const {
  std::vector<DateAlternative> alternatives;
  int seireki = kSeirekiOffset + twoDigitYear;
  if (isValidDate(seireki, month, day)) {
    alternatives.push_back(DateAlternative{seireki, DateInterpretation::Seireki});
  }
  bool ambiguous = !alternatives.empty();
  return makeResult(kHeiseiOffset + twoDigitYear, month, day, 0.85, InferenceMethod::HighProbHeisei,
                    ambiguous, std::move(alternatives));
}

DateInferenceResult DateInferenceEngine::defaultResult(int twoDigitYear, int month, int day) const {
  int heisei = kHeiseiOffset + twoDigitYear;
  if (twoDigitYear <= currentReiwaYear()) {
    std::vector<DateAlternative> alternatives;
    if (isValidDate(heisei, month, day)) {
      alternatives.push_back(DateAlternative{heisei, DateInterpretation::Heisei});
    }
    return makeResult(kReiwaOffset + twoDigitYear, month, day, 0.6, InferenceMethod::DefaultReiwa, true,
                      std::move(alternatives));
  }
  return makeResult(heisei, month, day, 0.7, InferenceMethod::HighProbHeisei, false);
}
