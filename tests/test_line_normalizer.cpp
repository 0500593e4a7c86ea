#include <catch2/catch_all.hpp>

#include "line_normalizer.hpp"

#include <string>
#include <vector>

TEST_CASE("normalizeLine maps dash, slash and colon variants", "[normalize]") {
  REQUIRE(normalizeLine("01−12−06") == "01-12-06");
  REQUIRE(normalizeLine("01―12―06") == "01-12-06");
  REQUIRE(normalizeLine("01／12／06") == "01/12/06");
  REQUIRE(normalizeLine("残高：500,000") == "残高-500,000");
  REQUIRE(normalizeLine("カード") == "カ-ド");
}

TEST_CASE("normalizeLine drops middle dots and asterisks", "[normalize]") {
  REQUIRE(normalizeLine("ﾌﾘｺﾐ・ﾐｽﾞﾎ") == "ﾌﾘｺﾐﾐｽﾞﾎ");
  REQUIRE(normalizeLine("**10,000") == "10,000");
}

TEST_CASE("normalizeLine collapses whitespace and stray spaces", "[normalize]") {
  REQUIRE(normalizeLine("  振込\t\t入金  ") == "振込 入金");
  REQUIRE(normalizeLine("振込　　入金") == "振込 入金");
  REQUIRE(normalizeLine("01 - 12 - 06") == "01-12-06");
  REQUIRE(normalizeLine("10 ,000") == "10,000");
  REQUIRE(normalizeLine("残高 : 1") == "残高: 1");
  REQUIRE(normalizeLine("01 -- 12") == "01-12");
  REQUIRE(normalizeLine("") == "");
}

TEST_CASE("normalizeLine is idempotent", "[normalize]") {
  const std::vector<std::string> samples = {
    "01−12−06 ﾌﾘｺﾐ ﾐｽﾞﾎ 10,000 500,000",
    "  口座番号：1234567  ",
    "R6／12／25 * カード",
    "お取引日　 摘要 - - お支払金額",
    "a - - - b",
  };
  for (const auto& raw : samples) {
    const std::string once = normalizeLine(raw);
    REQUIRE(normalizeLine(once) == once);
  }
}

TEST_CASE("normalizeLines drops lines that end up empty", "[normalize]") {
  std::vector<std::string> out = normalizeLines({"123", "  ", "・", "振込 入金"});
  REQUIRE(out == std::vector<std::string>{"123", "振込 入金"});
}
