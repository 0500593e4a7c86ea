#include "year_resolver.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <utility>

namespace {

std::optional<ResolvedDate> literal(const CalendarDate& date, std::optional<double> confidence = std::nullopt,
                                    std::optional<InferenceMethod> method = std::nullopt) {
  if (!isValidDate(date.year, date.month, date.day)) return std::nullopt;
  return ResolvedDate{date, confidence, method};
}

std::vector<std::string> splitOn(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : s) {
    if (ch == sep) {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  parts.push_back(current);
  return parts;
}

} // namespace

const char* toString(DateFormatHint hint) {
  switch (hint) {
    case DateFormatHint::Auto: return "auto";
    case DateFormatHint::Western: return "western";
    case DateFormatHint::Wareki: return "wareki";
  }
  return "auto";
}

std::optional<DateFormatHint> parseDateFormatHint(const std::string& text) {
  if (text == "auto") return DateFormatHint::Auto;
  if (text == "western") return DateFormatHint::Western;
  if (text == "wareki") return DateFormatHint::Wareki;
  return std::nullopt;
}

SimpleYearResolver::SimpleYearResolver(DateFormatHint hint)
  : m_hint(hint) {}

std::vector<std::optional<ResolvedDate>> SimpleYearResolver::resolve(const std::vector<RowDate>& dates) const {
  std::vector<std::optional<ResolvedDate>> out;
  out.reserve(dates.size());
  for (const auto& d : dates) {
    if (!d.era && d.yearDigits <= 2 && m_hint == DateFormatHint::Western) {
      out.push_back(literal(CalendarDate{kSeirekiOffset + d.printedYear, d.month, d.day}));
    } else {
      out.push_back(d.simple ? literal(*d.simple) : std::optional<ResolvedDate>());
    }
  }
  return out;
}

ContextualYearResolver::ContextualYearResolver(const DateInferenceEngine& engine, DateInferenceContext context)
  : m_engine(engine), m_context(std::move(context)) {}

std::vector<std::optional<ResolvedDate>> ContextualYearResolver::resolve(const std::vector<RowDate>& dates) const {
  std::vector<std::optional<ResolvedDate>> out(dates.size());

  std::vector<size_t> twoDigitIndex;
  std::vector<TwoDigitDate> twoDigit;
  for (size_t i = 0; i < dates.size(); ++i) {
    const RowDate& d = dates[i];
    if (d.era) {
      DateInferenceResult r = DateInferenceEngine::fromInterpretation(
        d.printedYear, d.month, d.day, *d.era, InferenceMethod::DefiniteWareki, 1.0);
      out[i] = literal(r.date(), r.confidence, r.method);
    } else if (d.yearDigits > 2) {
      if (d.simple) out[i] = literal(*d.simple, 1.0, InferenceMethod::DefiniteSeireki);
    } else {
      twoDigitIndex.push_back(i);
      twoDigit.push_back(TwoDigitDate{d.printedYear, d.month, d.day});
    }
  }

  std::vector<DateInferenceResult> inferred = m_engine.inferDatesBatch(twoDigit, m_context);
  for (size_t k = 0; k < inferred.size(); ++k) {
    const size_t i = twoDigitIndex[k];
    const DateInferenceResult& r = inferred[k];
    if (isValidDate(r.year, r.month, r.day)) {
      out[i] = ResolvedDate{r.date(), r.confidence, r.method};
    } else if (dates[i].simple) {
      // The cascade picked a year where this day does not exist; keep the table reading.
      out[i] = literal(*dates[i].simple);
    }
  }
  return out;
}

std::unique_ptr<YearResolver> makeYearResolver(const YearResolverOptions& options,
                                               const DateInferenceEngine& engine) {
  if (options.contextual) {
    DateInferenceContext context;
    context.bankCode = options.bankCode;
    return std::make_unique<ContextualYearResolver>(engine, context);
  }
  return std::make_unique<SimpleYearResolver>(options.hint);
}

std::vector<std::string> ignoredOptionWarnings(const YearResolverOptions& options) {
  std::vector<std::string> warnings;
  if (options.contextual) {
    if (options.hint != DateFormatHint::Auto) {
      warnings.push_back(std::string("--date-format=") + toString(options.hint)
                         + " is ignored with --contextual");
    }
    return warnings;
  }
  if (options.bankCode) {
    warnings.push_back("--bank-code=" + *options.bankCode + " only applies with --contextual");
  }
  if (options.hasLearnedFormats) {
    warnings.push_back("--learn only applies with --contextual");
  }
  return warnings;
}

std::optional<std::string> normalizeDateText(const std::string& text, DateFormatHint hint,
                                             const DateInferenceEngine& engine,
                                             const std::optional<std::string>& bankCode) {
  std::string value = trim(text);
  if (value.empty()) return std::nullopt;

  std::optional<DateInterpretation> era;
  const char marker = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
  if (marker == 'D' || marker == 'H' || marker == 'R' || marker == 'S') {
    if (marker == 'H') era = DateInterpretation::Heisei;
    else if (marker == 'R') era = DateInterpretation::Reiwa;
    else if (marker == 'S') era = DateInterpretation::Showa;
    value = trim(value.substr(1));
  }

  std::string dashed = value;
  for (char& ch : dashed) {
    if (ch == '/' || ch == '.' || ch == ' ') ch = '-';
  }
  if (auto iso = parseIsoDate(dashed)) return iso->toIsoString();

  std::vector<std::string> parts = splitOn(dashed, '-');
  if (parts.size() != 3) return std::nullopt;
  for (const auto& p : parts) {
    if (!isAsciiDigits(p) || p.size() > 4) return std::nullopt;
  }

  int year = std::stoi(parts[0]);
  const int month = std::stoi(parts[1]);
  const int day = std::stoi(parts[2]);
  if (year < 100) {
    if (era) {
      year = toGregorianYear(year, *era);
    } else if (hint == DateFormatHint::Western) {
      year = kSeirekiOffset + year;
    } else {
      DateInferenceContext context;
      context.bankCode = bankCode;
      year = engine.inferDate(year, month, day, context).year;
    }
  }
  if (!isValidDate(year, month, day)) return std::nullopt;
  return CalendarDate{year, month, day}.toIsoString();
}
