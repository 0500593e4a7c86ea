#pragma once

#include <optional>
#include <string>
#include <vector>

struct TransactionLine {
  std::optional<std::string> transactionDate;  // YYYY-MM-DD
  std::string description;
  std::optional<long long> withdrawalAmount;
  std::optional<long long> depositAmount;
  std::optional<long long> balance;
  std::optional<double> confidence;

  // A line with no date, no description and no amount carries nothing.
  bool isValid() const;
};

// A numeric match in row text, after the noise filter.
struct AmountToken {
  long long value;   // signed
  bool explicitSign; // written with a leading '+' or '-'
};

// Signed, comma-grouped integers in text. Values with |v| < 10 are dropped
// as misread row or column indices. A sign counts only at the start of a
// token; "振込-10,000" reads as 10000.
std::vector<AmountToken> extractAmounts(const std::string& text);

// Parses one amount token ("10,000", "-500"); nothing for non-numeric text.
std::optional<long long> parseAmount(const std::string& token);

// True when the text mentions a deposit-type keyword (振込, 入金, 預入, 配当, ...).
bool mentionsDeposit(const std::string& text);

// Builds the non-date fields of a row from the tokens its date left behind.
// The last amount is the balance; with two or more amounts the first is the
// primary amount, a deposit when signed '+' or the description names a
// deposit, a withdrawal otherwise. Returns nothing for an empty row.
std::optional<TransactionLine> buildTransactionFields(const std::vector<std::string>& tokens);
