#pragma once

#include "calendar.hpp"
#include "compact_date_parser.hpp"
#include "date_inference.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Two-digit-year hint supplied with a document.
enum class DateFormatHint {
  Auto,
  Western,  // 20 -> 2020
  Wareki,
};

const char* toString(DateFormatHint hint);

std::optional<DateFormatHint> parseDateFormatHint(const std::string& text);

struct ResolvedDate {
  CalendarDate date{0, 0, 0};
  std::optional<double> confidence;
  std::optional<InferenceMethod> method;
};

// Turns the row dates of one document into calendar dates. Implementations
// see every date of the document at once, in document order.
class YearResolver {
public:
  virtual ~YearResolver() = default;

  // One entry per input date; nothing where the date is not a real day.
  virtual std::vector<std::optional<ResolvedDate>> resolve(const std::vector<RowDate>& dates) const = 0;
};

// Static era table, no context. Western forces 2000 + y for two-digit years.
class SimpleYearResolver : public YearResolver {
public:
  explicit SimpleYearResolver(DateFormatHint hint = DateFormatHint::Auto);

  std::vector<std::optional<ResolvedDate>> resolve(const std::vector<RowDate>& dates) const override;

private:
  DateFormatHint m_hint;
};

// Full DateInferenceEngine cascade with a document-wide context.
class ContextualYearResolver : public YearResolver {
public:
  ContextualYearResolver(const DateInferenceEngine& engine, DateInferenceContext context);

  std::vector<std::optional<ResolvedDate>> resolve(const std::vector<RowDate>& dates) const override;

private:
  const DateInferenceEngine& m_engine;
  DateInferenceContext m_context;
};

// Resolver choice as given on the command line. The bank code and learned
// formats feed the contextual resolver only; the hint feeds the simple one.
struct YearResolverOptions {
  bool contextual = false;
  std::optional<std::string> bankCode;
  DateFormatHint hint = DateFormatHint::Auto;
  bool hasLearnedFormats = false;
};

// The engine must outlive a contextual resolver.
std::unique_ptr<YearResolver> makeYearResolver(const YearResolverOptions& options,
                                               const DateInferenceEngine& engine);

// One message per option the chosen resolver will not read.
std::vector<std::string> ignoredOptionWarnings(const YearResolverOptions& options);

// Normalizes a free-form date string to YYYY-MM-DD. Accepts ISO dates,
// '/', '.' or ' ' separators and a leading D/H/R/S marker. Two-digit years
// are 2000 + y under Western and go through the engine otherwise.
std::optional<std::string> normalizeDateText(const std::string& text, DateFormatHint hint,
                                             const DateInferenceEngine& engine,
                                             const std::optional<std::string>& bankCode = std::nullopt);
