#include "transaction_builder.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <cstdlib>
#include <regex>

namespace {

constexpr long long kNoiseThreshold = 10;
constexpr size_t kMaxAmountDigits = 15;

const std::regex& amountPattern() {
  static const std::regex re("[+-]?[0-9][0-9,]*");
  return re;
}

const std::vector<std::string>& depositKeywords() {
  static const std::vector<std::string> kKeywords = {
    "振込", "入金", "預入", "配当", "振込入金", "定期積金",
  };
  return kKeywords;
}

bool isAmountToken(const std::string& token) {
  static const std::regex whole("^[+-]?[0-9][0-9,]*$");
  return std::regex_match(token, whole);
}

std::optional<long long> toNumber(const std::string& digitsWithCommas, bool negative) {
  std::string digits;
  for (char ch : digitsWithCommas) {
    if (std::isdigit(static_cast<unsigned char>(ch))) digits.push_back(ch);
  }
  if (digits.empty() || digits.size() > kMaxAmountDigits) return std::nullopt;
  long long v = std::stoll(digits);
  return negative ? -v : v;
}

} // namespace

bool TransactionLine::isValid() const {
  return transactionDate.has_value() || !description.empty() || withdrawalAmount.has_value()
      || depositAmount.has_value() || balance.has_value();
}

std::optional<long long> parseAmount(const std::string& token) {
  std::string t = trim(token);
  if (!isAmountToken(t)) return std::nullopt;
  bool negative = t[0] == '-';
  return toNumber(t, negative);
}

std::vector<AmountToken> extractAmounts(const std::string& text) {
  std::vector<AmountToken> out;
  auto begin = std::sregex_iterator(text.begin(), text.end(), amountPattern());
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    std::string found = it->str();
    const size_t pos = static_cast<size_t>(it->position());
    bool signedAtTokenStart = false;
    if (found[0] == '+' || found[0] == '-') {
      signedAtTokenStart = pos == 0 || std::isspace(static_cast<unsigned char>(text[pos - 1]));
      if (!signedAtTokenStart) found.erase(0, 1);
    }
    std::optional<long long> value = toNumber(found, signedAtTokenStart && found[0] == '-');
    if (!value || std::llabs(*value) < kNoiseThreshold) continue;
    out.push_back(AmountToken{*value, signedAtTokenStart});
  }
  return out;
}

bool mentionsDeposit(const std::string& text) {
  for (const auto& keyword : depositKeywords()) {
    if (text.find(keyword) != std::string::npos) return true;
  }
  return false;
}

std::optional<TransactionLine> buildTransactionFields(const std::vector<std::string>& tokens) {
  std::vector<std::string> textTokens;
  for (const auto& token : tokens) {
    if (!isAmountToken(token)) textTokens.push_back(token);
  }

  TransactionLine line;
  line.description = joinWithSpace(textTokens.empty() ? tokens : textTokens);

  const std::vector<AmountToken> amounts = extractAmounts(joinWithSpace(tokens));
  if (amounts.empty() && line.description.empty()) return std::nullopt;
  if (amounts.empty()) return line;

  line.balance = amounts.back().value;
  if (amounts.size() >= 2) {
    const AmountToken& primary = amounts.front();
    const long long magnitude = std::llabs(primary.value);
    if (primary.explicitSign && primary.value < 0) {
      line.withdrawalAmount = magnitude;
    } else if (primary.explicitSign || mentionsDeposit(line.description)) {
      line.depositAmount = magnitude;
    } else {
      line.withdrawalAmount = magnitude;
    }
  }
  return line;
}
