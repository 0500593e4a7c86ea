#include "date_inference.hpp"
#include "line_normalizer.hpp"
#include "passbook_parser.hpp"
#include "text_source.hpp"
#include "year_resolver.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string quoted(const std::string& s) {
  return "\"" + jsonEscape(s) + "\"";
}

std::string optionalString(const std::optional<std::string>& v) {
  return v ? quoted(*v) : "null";
}

std::string optionalAmount(const std::optional<long long>& v) {
  return v ? std::to_string(*v) : "null";
}

std::string optionalConfidence(const std::optional<double>& v) {
  if (!v) return "null";
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", *v);
  return buf;
}

// CODE:ERA, e.g. 0005:reiwa
void applyLearnFlag(const std::string& value, LearnedBankFormats& learned) {
  size_t colon = value.find(':');
  if (colon == std::string::npos || colon == 0) {
    throw std::invalid_argument("--learn expects CODE:ERA, got '" + value + "'");
  }
  std::optional<DateInterpretation> era = parseDateInterpretation(value.substr(colon + 1));
  if (!era) {
    throw std::invalid_argument("Unknown era in --learn: '" + value.substr(colon + 1) + "'");
  }
  learned.learn(value.substr(0, colon), *era);
}

void printResult(const PassbookParseResult& result) {
  const AssetRecord& asset = result.asset;

  std::cout << "{\n";
  std::cout << "  \"category\": " << quoted(toString(asset.category())) << ",\n";
  std::cout << "  \"type\": " << quoted(asset.type()) << ",\n";
  std::cout << "  \"sourceDocument\": " << quoted(asset.sourceDocument()) << ",\n";

  std::cout << "  \"ownerNames\": [";
  for (size_t i = 0; i < asset.ownerNames().size(); ++i) {
    std::cout << quoted(asset.ownerNames()[i]) << (i + 1 == asset.ownerNames().size() ? "" : ", ");
  }
  std::cout << "],\n";

  std::cout << "  \"assetName\": " << quoted(asset.assetName()) << ",\n";
  std::cout << "  \"accountNumber\": " << optionalString(asset.identifierPrimary()) << ",\n";
  std::cout << "  \"branchName\": " << optionalString(asset.identifierSecondary()) << ",\n";
  std::cout << "  \"valuation\": {\"basis\": " << optionalString(asset.valuationBasis())
            << ", \"currency\": " << quoted(asset.valuationCurrency())
            << ", \"amount\": " << optionalAmount(asset.valuationAmount()) << "},\n";
  std::cout << "  \"diagnostics\": {\"strategy\": " << quoted(toString(result.strategy))
            << ", \"rowsSeen\": " << result.rowsSeen
            << ", \"rowsAccepted\": " << result.rowsAccepted << "},\n";
  std::cout << "  \"notes\": " << quoted(asset.notes()) << ",\n";

  const auto& txs = asset.transactions();
  std::cout << "  \"transactions\": [";
  for (size_t i = 0; i < txs.size(); ++i) {
    const TransactionLine& t = txs[i];
    std::cout << (i == 0 ? "\n" : "")
              << "    {\"date\": " << optionalString(t.transactionDate)
              << ", \"description\": " << quoted(t.description)
              << ", \"withdrawal\": " << optionalAmount(t.withdrawalAmount)
              << ", \"deposit\": " << optionalAmount(t.depositAmount)
              << ", \"balance\": " << optionalAmount(t.balance)
              << ", \"confidence\": " << optionalConfidence(t.confidence) << "}"
              << (i + 1 == txs.size() ? "\n  " : ",\n");
  }
  std::cout << "]\n";
  std::cout << "}\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string inputPath;
    YearResolverOptions resolverOptions;
    bool rawLines = false;
    bool verbose = false;
    ParseOptions options;
    options.normalizeDescriptions = true;
    LearnedBankFormats learned;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--contextual") {
        resolverOptions.contextual = true;
      } else if (arg == "--raw") {
        rawLines = true;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg == "--keep-descriptions") {
        options.normalizeDescriptions = false;
      } else if (arg.rfind("--bank-code=", 0) == 0) {
        resolverOptions.bankCode = arg.substr(std::string("--bank-code=").size());
      } else if (arg.rfind("--date-format=", 0) == 0) {
        std::string value = arg.substr(std::string("--date-format=").size());
        std::optional<DateFormatHint> parsed = parseDateFormatHint(value);
        if (!parsed) throw std::invalid_argument("Unknown --date-format: '" + value + "'");
        resolverOptions.hint = *parsed;
      } else if (arg.rfind("--learn=", 0) == 0) {
        applyLearnFlag(arg.substr(std::string("--learn=").size()), learned);
        resolverOptions.hasLearnedFormats = true;
      } else if (inputPath.empty()) {
        inputPath = arg;
      }
    }

    if (inputPath.empty() || !std::filesystem::exists(inputPath)) {
      std::cerr << "Input not found: " << inputPath << "\n";
      std::cerr << "Usage: " << argv[0]
                << " [--contextual] [--bank-code=NNNN] [--date-format=auto|western|wareki]"
                   " [--learn=CODE:ERA] [--keep-descriptions] [--raw] [--verbose] <txt_or_pdf_path>\n";
      return 2;
    }

    for (const auto& warning : ignoredOptionWarnings(resolverOptions)) {
      std::cerr << "Warning: " << warning << "\n";
    }

    std::vector<std::string> lines = loadDocumentLines(inputPath);

    if (rawLines) {
      for (const auto& line : normalizeLines(lines)) std::cout << line << "\n";
      return 0;
    }

    DocumentCategory category = detectDocumentType(lines);
    if (category != DocumentCategory::BankDeposit) {
      std::cerr << "Warning: document looks like '" << toString(category)
                << "', parsing as a bank passbook anyway\n";
    }

    DateInferenceEngine engine(learned);
    std::unique_ptr<YearResolver> resolver = makeYearResolver(resolverOptions, engine);

    std::string sourceName = std::filesystem::path(inputPath).filename().string();
    PassbookParseResult result = parsePassbook(lines, sourceName, *resolver, options);

    if (verbose) {
      std::cerr << "Segmentation: " << toString(result.strategy) << "\n";
      std::cerr << "Rows accepted: " << result.rowsAccepted << "/" << result.rowsSeen << "\n";
      if (resolverOptions.contextual) std::cerr << "Current Reiwa year: " << engine.currentReiwaYear() << "\n";
    }

    printResult(result);
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
