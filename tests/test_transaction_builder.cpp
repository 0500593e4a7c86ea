#include <catch2/catch_all.hpp>

#include "transaction_builder.hpp"

#include <string>
#include <vector>

TEST_CASE("extractAmounts drops noise and keeps explicit signs", "[builder]") {
  std::vector<AmountToken> amounts = extractAmounts("3 ATM -5,000 +1,200 9 20,000");
  REQUIRE(amounts.size() == 3);
  REQUIRE(amounts[0].value == -5000);
  REQUIRE(amounts[0].explicitSign);
  REQUIRE(amounts[1].value == 1200);
  REQUIRE(amounts[1].explicitSign);
  REQUIRE(amounts[2].value == 20000);
  REQUIRE_FALSE(amounts[2].explicitSign);
}

TEST_CASE("extractAmounts ignores a sign glued to text", "[builder]") {
  std::vector<AmountToken> amounts = extractAmounts("振込-10,000");
  REQUIRE(amounts.size() == 1);
  REQUIRE(amounts[0].value == 10000);
  REQUIRE_FALSE(amounts[0].explicitSign);
}

TEST_CASE("parseAmount accepts only whole amount tokens", "[builder]") {
  REQUIRE(parseAmount("10,000") == 10000);
  REQUIRE(parseAmount("-500") == -500);
  REQUIRE_FALSE(parseAmount("ATM").has_value());
  REQUIRE_FALSE(parseAmount("10円").has_value());
}

TEST_CASE("deposit keywords route the primary amount to deposit", "[builder]") {
  auto line = buildTransactionFields({"振込", "入金", "10,000", "500,000"});
  REQUIRE(line.has_value());
  REQUIRE(line->description == "振込 入金");
  REQUIRE(line->depositAmount == 10000);
  REQUIRE_FALSE(line->withdrawalAmount.has_value());
  REQUIRE(line->balance == 500000);
}

TEST_CASE("rows without a deposit keyword are withdrawals", "[builder]") {
  auto line = buildTransactionFields({"カード", "5,000", "495,000"});
  REQUIRE(line.has_value());
  REQUIRE(line->withdrawalAmount == 5000);
  REQUIRE_FALSE(line->depositAmount.has_value());
  REQUIRE(line->balance == 495000);
}

TEST_CASE("explicit signs decide the direction", "[builder]") {
  auto out = buildTransactionFields({"振込", "-3,000", "97,000"});
  REQUIRE(out.has_value());
  REQUIRE(out->withdrawalAmount == 3000);
  REQUIRE_FALSE(out->depositAmount.has_value());

  auto in = buildTransactionFields({"ATM", "+3,000", "103,000"});
  REQUIRE(in.has_value());
  REQUIRE(in->depositAmount == 3000);
  REQUIRE_FALSE(in->withdrawalAmount.has_value());
}

TEST_CASE("a single amount is a balance-only line", "[builder]") {
  auto line = buildTransactionFields({"繰越", "123,456"});
  REQUIRE(line.has_value());
  REQUIRE(line->balance == 123456);
  REQUIRE_FALSE(line->withdrawalAmount.has_value());
  REQUIRE_FALSE(line->depositAmount.has_value());
}

TEST_CASE("rows with no text and no usable amount are dropped", "[builder]") {
  REQUIRE_FALSE(buildTransactionFields({}).has_value());

  auto noiseOnly = buildTransactionFields({"3"});
  REQUIRE(noiseOnly.has_value());
  REQUIRE(noiseOnly->description == "3");
  REQUIRE_FALSE(noiseOnly->balance.has_value());

  auto amountsOnly = buildTransactionFields({"10,000", "20,000"});
  REQUIRE(amountsOnly.has_value());
  REQUIRE(amountsOnly->description == "10,000 20,000");
  REQUIRE(amountsOnly->withdrawalAmount == 10000);
}

TEST_CASE("TransactionLine validity", "[builder]") {
  TransactionLine empty;
  REQUIRE_FALSE(empty.isValid());

  TransactionLine dated;
  dated.transactionDate = std::string("2019-12-06");
  REQUIRE(dated.isValid());
}
