#include <catch2/catch_all.hpp>

#include "date_inference.hpp"

#include <string>
#include <vector>

namespace {

// Reiwa 8; keeps the Reiwa cut-off independent of the wall clock.
constexpr int kTestYear = 2026;

DateInferenceContext bankContext(const std::string& code) {
  DateInferenceContext context;
  context.bankCode = code;
  return context;
}

} // namespace

TEST_CASE("years from 32 up are Gregorian", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceResult r = engine.inferDate(32, 1, 1);
  REQUIRE(r.year == 2032);
  REQUIRE(r.confidence == Catch::Approx(1.0));
  REQUIRE(r.method == InferenceMethod::DefiniteSeireki);
  REQUIRE_FALSE(r.isAmbiguous);

  DateInferenceResult last = engine.inferDate(99, 12, 31);
  REQUIRE(last.year == 2099);
  REQUIRE(last.method == InferenceMethod::DefiniteSeireki);
}

TEST_CASE("8 to 31 is high-probability Heisei", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceResult r = engine.inferDate(17, 11, 24);
  REQUIRE(r.year == 2005);
  REQUIRE(r.method == InferenceMethod::HighProbHeisei);
  REQUIRE(r.confidence >= 0.8);
  REQUIRE(r.isAmbiguous);
  REQUIRE(r.alternatives.size() == 1);
  REQUIRE(r.alternatives[0].year == 2017);
  REQUIRE(r.alternatives[0].interpretation == DateInterpretation::Seireki);

  REQUIRE(engine.inferDate(8, 6, 15).year == 1996);
  REQUIRE(engine.inferDate(31, 1, 1).year == 2019);
}

TEST_CASE("small years default to Reiwa with a Heisei alternative", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceResult r = engine.inferDate(1, 12, 6);
  REQUIRE(r.year == 2019);
  REQUIRE(r.method == InferenceMethod::DefaultReiwa);
  REQUIRE(r.confidence == Catch::Approx(0.6));
  REQUIRE(r.isAmbiguous);
  for (const auto& alt : r.alternatives) {
    if (alt.interpretation == DateInterpretation::Heisei) REQUIRE(alt.year == 1989);
  }
  REQUIRE(r.toIsoDate() == "2019-12-06");
}

TEST_CASE("Reiwa 2 February 29 is a leap day", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceResult r = engine.inferDate(2, 2, 29);
  REQUIRE(r.year == 2020);
  REQUIRE(r.alternatives.empty());
  REQUIRE(isValidDate(r.year, r.month, r.day));
}

TEST_CASE("years past the current Reiwa year fall back to Heisei", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, 2023);
  REQUIRE(engine.currentReiwaYear() == 5);

  DateInferenceResult r = engine.inferDate(7, 1, 1);
  REQUIRE(r.year == 1995);
  REQUIRE(r.method == InferenceMethod::HighProbHeisei);
  REQUIRE(r.confidence == Catch::Approx(0.7));
  REQUIRE_FALSE(r.isAmbiguous);
}

TEST_CASE("known Gregorian banks force 2000 + y", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceResult mizuho = engine.inferDate(17, 11, 24, bankContext("0001"));
  REQUIRE(mizuho.year == 2017);
  REQUIRE(mizuho.method == InferenceMethod::BankLookup);
  REQUIRE(mizuho.confidence == Catch::Approx(0.9));

  DateInferenceResult rokin = engine.inferDate(5, 3, 15, bankContext("2952"));
  REQUIRE(rokin.year == 2005);
  REQUIRE(rokin.method == InferenceMethod::BankLookup);
}

TEST_CASE("known wareki banks choose between Reiwa and Heisei", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceResult both = engine.inferDate(5, 4, 1, bankContext("0005"));
  REQUIRE(both.year == 2023);
  REQUIRE(both.method == InferenceMethod::BankLookup);
  REQUIRE(both.confidence == Catch::Approx(0.7));
  REQUIRE(both.isAmbiguous);
  REQUIRE(both.alternatives.size() == 1);
  REQUIRE(both.alternatives[0].year == 1993);

  DateInferenceResult pastReiwa = engine.inferDate(20, 4, 1, bankContext("0009"));
  REQUIRE(pastReiwa.year == 2008);
  REQUIRE(pastReiwa.method == InferenceMethod::BankLookup);
  REQUIRE(pastReiwa.confidence == Catch::Approx(0.85));
  REQUIRE_FALSE(pastReiwa.isAmbiguous);

  // Only the Reiwa reading is a real day.
  DateInferenceResult leap = engine.inferDate(2, 2, 29, bankContext("0010"));
  REQUIRE(leap.year == 2020);
  REQUIRE(leap.confidence == Catch::Approx(0.85));
  REQUIRE_FALSE(leap.isAmbiguous);
}

TEST_CASE("bank name resolves to a known bank code", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceContext context;
  context.bankName = "みずほ銀行 新宿支店";
  DateInferenceResult r = engine.inferDate(17, 11, 24, context);
  REQUIRE(r.year == 2017);
  REQUIRE(r.method == InferenceMethod::BankLookup);
  REQUIRE(bankCodeForName("三井住友銀行") == std::string("0009"));
  REQUIRE_FALSE(bankCodeForName("架空銀行").has_value());
}

TEST_CASE("learned formats win over known banks", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  engine.learnBankFormat("9999", DateInterpretation::Seireki);
  DateInferenceResult r = engine.inferDate(17, 11, 24, bankContext("9999"));
  REQUIRE(r.year == 2017);
  REQUIRE(r.method == InferenceMethod::UserConfirmed);
  REQUIRE(r.confidence == Catch::Approx(0.95));

  engine.learnBankFormat("0005", DateInterpretation::Heisei);
  DateInferenceResult overridden = engine.inferDate(3, 4, 1, bankContext("0005"));
  REQUIRE(overridden.year == 1991);
  REQUIRE(overridden.method == InferenceMethod::UserConfirmed);

  auto table = engine.learnedFormats();
  REQUIRE(table.size() == 2);
  REQUIRE(table.at("9999") == DateInterpretation::Seireki);
}

TEST_CASE("learned tables are not shared between callers", "[inference]") {
  LearnedBankFormats first;
  LearnedBankFormats second;
  DateInferenceEngine a(first, kTestYear);
  DateInferenceEngine b(second, kTestYear);

  a.learnBankFormat("9999", DateInterpretation::Seireki);
  REQUIRE(a.inferDate(17, 11, 24, bankContext("9999")).year == 2017);
  REQUIRE(b.inferDate(17, 11, 24, bankContext("9999")).year == 2005);
  REQUIRE(b.learnedFormats().empty());
}

TEST_CASE("a confirmed format applies after the Gregorian rule", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceContext context;
  context.userConfirmedFormat = DateInterpretation::Heisei;
  DateInferenceResult r = engine.inferDate(3, 4, 1, context);
  REQUIRE(r.year == 1991);
  REQUIRE(r.method == InferenceMethod::UserConfirmed);

  REQUIRE(engine.inferDate(40, 4, 1, context).method == InferenceMethod::DefiniteSeireki);
}

TEST_CASE("context picks the era that fits the confident years", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  std::vector<DateInferenceResult> results =
    engine.inferDatesBatch({{10, 1, 5}, {12, 3, 1}, {7, 4, 1}});
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].year == 1998);
  REQUIRE(results[1].year == 2000);
  REQUIRE(results[2].year == 1995);
  REQUIRE(results[2].method == InferenceMethod::ContextBased);
  REQUIRE(results[2].confidence == Catch::Approx(0.8));
}

TEST_CASE("context ties go to the nearest preceding confident year", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  std::vector<DateInferenceResult> recent =
    engine.inferDatesBatch({{10, 1, 1}, {30, 1, 1}, {5, 6, 1}});
  REQUIRE(recent[2].year == 2023);
  REQUIRE(recent[2].method == InferenceMethod::ContextBased);

  std::vector<DateInferenceResult> older =
    engine.inferDatesBatch({{30, 1, 1}, {10, 1, 1}, {5, 6, 1}});
  REQUIRE(older[2].year == 1993);
  REQUIRE(older[2].method == InferenceMethod::ContextBased);
}

TEST_CASE("context without confident years falls through to the default", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  DateInferenceContext context;
  context.surroundingDates = {"03-01-01", "04-02-02"};
  context.currentIndex = 0;
  DateInferenceResult r = engine.inferDate(3, 1, 1, context);
  REQUIRE(r.year == 2021);
  REQUIRE(r.method == InferenceMethod::DefaultReiwa);
}

TEST_CASE("ISO output parses back to the same date", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  for (int y = 0; y < 100; ++y) {
    for (int m = 1; m <= 12; ++m) {
      DateInferenceResult r = engine.inferDate(y, m, 28);
      auto parsed = parseIsoDate(r.toIsoDate());
      REQUIRE(parsed.has_value());
      REQUIRE(*parsed == r.date());
    }
  }
}

TEST_CASE("results render in wareki", "[inference]") {
  LearnedBankFormats learned;
  DateInferenceEngine engine(learned, kTestYear);

  REQUIRE(engine.inferDate(6, 12, 25).toWarekiDisplay() == "R6/12/25");
  REQUIRE(engine.inferDate(30, 5, 1).toWarekiDisplay() == "H30/05/01");
  REQUIRE(engine.inferDate(60, 1, 15).toWarekiDisplay() == "R42/01/15");
  REQUIRE(std::string(toString(InferenceMethod::ContextBased)) == "context_based");
  REQUIRE(formatTwoDigitDate({5, 6, 1}) == "05-06-01");
}
