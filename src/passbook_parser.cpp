#include "passbook_parser.hpp"

#include "compact_date_parser.hpp"
#include "description_normalizer.hpp"
#include "line_normalizer.hpp"
#include "text_utils.hpp"

#include <utility>

namespace {

constexpr size_t kNoteLines = 30;

bool containsAny(const std::string& text, const std::vector<std::string>& keywords) {
  for (const auto& k : keywords) {
    if (text.find(k) != std::string::npos) return true;
  }
  return false;
}

std::vector<std::string> rowTokens(const Row& row, SegmentationStrategy strategy) {
  std::vector<std::string> tokens;
  size_t first = strategy == SegmentationStrategy::RowCode ? 1 : 0;
  for (size_t i = first; i < row.lines.size(); ++i) {
    for (auto& token : splitWhitespace(row.lines[i])) tokens.push_back(std::move(token));
  }
  return tokens;
}

std::optional<long long> statedBalance(const std::vector<std::string>& lines) {
  static const std::vector<std::string> kBalanceKeywords = {"残高", "繰越残高"};
  for (const auto& line : lines) {
    if (!containsAny(line, kBalanceKeywords)) continue;
    std::vector<AmountToken> amounts = extractAmounts(line);
    if (amounts.empty()) return std::nullopt;
    return amounts.front().value;
  }
  return std::nullopt;
}

std::string leadingNotes(const std::vector<std::string>& lines) {
  std::string notes;
  for (size_t i = 0; i < lines.size() && i < kNoteLines; ++i) {
    if (i > 0) notes += '\n';
    notes += lines[i];
  }
  return notes;
}

} // namespace

const char* toString(DocumentCategory category) {
  switch (category) {
    case DocumentCategory::BankDeposit: return "bank_deposit";
    case DocumentCategory::Land: return "land";
    case DocumentCategory::Building: return "building";
    case DocumentCategory::TransactionHistory: return "transaction_history";
    case DocumentCategory::Unknown: return "unknown";
  }
  return "unknown";
}

DocumentCategory detectDocumentType(const std::vector<std::string>& lines) {
  for (const auto& line : lines) {
    if (containsAny(line, {"普通預金", "通帳", "預金", "入出金"})) return DocumentCategory::BankDeposit;
  }
  for (const auto& line : lines) {
    if (containsAny(line, {"固定資産税", "地番", "家屋"})) return DocumentCategory::Land;
  }
  return DocumentCategory::Unknown;
}

AssetRecord::AssetRecord(Fields fields)
  : m_fields(std::move(fields)) {}

void AssetRecord::appendNote(const std::string& note) {
  if (!m_fields.notes.empty()) m_fields.notes += '\n';
  m_fields.notes += note;
}

TransactionAssembly assembleTransactions(const Segmentation& segmentation, const YearResolver& resolver,
                                         const ParseOptions& options) {
  TransactionAssembly out;
  std::vector<RowDate> dates;
  std::vector<TransactionLine> pending;

  for (const auto& row : segmentation.rows) {
    out.rowsSeen++;
    std::optional<RowDateMatch> match = parseRowDate(rowTokens(row, segmentation.strategy));
    if (!match) continue;
    std::optional<TransactionLine> line = buildTransactionFields(match->remainder);
    if (!line) continue;
    if (options.normalizeDescriptions) line->description = normalizeDescription(line->description);
    dates.push_back(match->date);
    pending.push_back(std::move(*line));
  }

  std::vector<std::optional<ResolvedDate>> resolved = resolver.resolve(dates);
  for (size_t i = 0; i < pending.size() && i < resolved.size(); ++i) {
    if (!resolved[i]) continue;
    TransactionLine& line = pending[i];
    line.transactionDate = resolved[i]->date.toIsoString();
    line.confidence = resolved[i]->confidence;
    if (!line.isValid()) continue;
    out.transactions.push_back(std::move(line));
    out.rowsAccepted++;
  }
  return out;
}

PassbookParseResult parsePassbook(const std::vector<std::string>& lines, const std::string& sourceName,
                                  const YearResolver& resolver, const ParseOptions& options) {
  const std::vector<std::string> normalized = normalizeLines(lines);
  const Segmentation segmentation = segmentRows(normalized);
  TransactionAssembly assembly = assembleTransactions(segmentation, resolver, options);
  const PassbookMetadata meta = extractMetadata(normalized);

  AssetRecord::Fields fields;
  fields.category = DocumentCategory::BankDeposit;
  fields.type = "ordinary_deposit";
  fields.sourceDocument = sourceName;
  if (meta.ownerName) fields.ownerNames.push_back(*meta.ownerName);
  fields.assetName = "普通預金";
  fields.identifierPrimary = meta.accountNumber;
  fields.identifierSecondary = meta.branchName;
  fields.valuationAmount = statedBalance(normalized);
  if (fields.valuationAmount) fields.valuationBasis = "通帳残高";
  fields.notes = leadingNotes(normalized);
  fields.transactions = std::move(assembly.transactions);

  AssetRecord asset(std::move(fields));
  if (assembly.rowsAccepted < assembly.rowsSeen) {
    asset.appendNote("rows accepted: " + std::to_string(assembly.rowsAccepted) + "/"
                     + std::to_string(assembly.rowsSeen));
  }
  return PassbookParseResult{std::move(asset), segmentation.strategy, assembly.rowsSeen, assembly.rowsAccepted};
}
