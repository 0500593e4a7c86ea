#pragma once

#include "metadata_extractor.hpp"
#include "row_segmenter.hpp"
#include "transaction_builder.hpp"
#include "year_resolver.hpp"

#include <optional>
#include <string>
#include <vector>

enum class DocumentCategory {
  BankDeposit,
  Land,
  Building,
  TransactionHistory,
  Unknown,
};

const char* toString(DocumentCategory category);

// Keyword scan: 普通預金/通帳/預金/入出金 -> BankDeposit, 固定資産税/地番/家屋
// -> Land, otherwise Unknown. Building and TransactionHistory are never
// detected; they exist for records built by callers.
DocumentCategory detectDocumentType(const std::vector<std::string>& lines);

// One asset per source document, with its transactions. Fixed at
// construction; only notes can be appended afterwards.
class AssetRecord {
public:
  struct Fields {
    DocumentCategory category = DocumentCategory::Unknown;
    std::string type;
    std::string sourceDocument;
    std::vector<std::string> ownerNames;
    std::string assetName;
    std::optional<std::string> identifierPrimary;    // account number
    std::optional<std::string> identifierSecondary;  // branch
    std::optional<std::string> valuationBasis;
    std::string valuationCurrency = "JPY";
    std::optional<long long> valuationAmount;
    std::string notes;
    std::vector<TransactionLine> transactions;
  };

  explicit AssetRecord(Fields fields);

  DocumentCategory category() const { return m_fields.category; }
  const std::string& type() const { return m_fields.type; }
  const std::string& sourceDocument() const { return m_fields.sourceDocument; }
  const std::vector<std::string>& ownerNames() const { return m_fields.ownerNames; }
  const std::string& assetName() const { return m_fields.assetName; }
  const std::optional<std::string>& identifierPrimary() const { return m_fields.identifierPrimary; }
  const std::optional<std::string>& identifierSecondary() const { return m_fields.identifierSecondary; }
  const std::optional<std::string>& valuationBasis() const { return m_fields.valuationBasis; }
  const std::string& valuationCurrency() const { return m_fields.valuationCurrency; }
  const std::optional<long long>& valuationAmount() const { return m_fields.valuationAmount; }
  const std::string& notes() const { return m_fields.notes; }
  const std::vector<TransactionLine>& transactions() const { return m_fields.transactions; }

  // Adds a line to the notes, newline separated.
  void appendNote(const std::string& note);

private:
  Fields m_fields;
};

struct ParseOptions {
  // Run normalizeDescription() over every description.
  bool normalizeDescriptions = false;
};

// Transactions of one document plus how many rows made it through.
struct TransactionAssembly {
  std::vector<TransactionLine> transactions;
  size_t rowsSeen = 0;
  size_t rowsAccepted = 0;
};

// Dates every row, builds its fields and resolves the years in one pass
// over the document. Rows without a date or without content are dropped
// and only counted.
TransactionAssembly assembleTransactions(const Segmentation& segmentation, const YearResolver& resolver,
                                         const ParseOptions& options = ParseOptions());

struct PassbookParseResult {
  AssetRecord asset;
  SegmentationStrategy strategy = SegmentationStrategy::None;
  size_t rowsSeen = 0;
  size_t rowsAccepted = 0;
};

// Full pipeline over the raw OCR lines of one passbook.
PassbookParseResult parsePassbook(const std::vector<std::string>& lines, const std::string& sourceName,
                                  const YearResolver& resolver, const ParseOptions& options = ParseOptions());
