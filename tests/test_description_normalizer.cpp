#include <catch2/catch_all.hpp>

#include "description_normalizer.hpp"

#include <string>

TEST_CASE("normalizeDescription collapses known payment rows", "[description]") {
  REQUIRE(normalizeDescription("RT 普通預金 ペイペイ") == "RT (ペイペイ)");
  REQUIRE(normalizeDescription("取扱店: 51317 カード") == "カード");
  REQUIRE(normalizeDescription("取扱店: 51317 払込み") == "払込み");
  REQUIRE(normalizeDescription("払込金 12345") == "払込み");
  REQUIRE(normalizeDescription("カ-ド 001") == "カード");
  REQUIRE(normalizeDescription("") == "");
  REQUIRE(normalizeDescription("   ") == "");
}

TEST_CASE("normalizeDescription expands katakana abbreviations", "[description]") {
  REQUIRE(normalizeDescription("ﾌﾘｺﾐ ﾐｽﾞﾎ") == "振込 みずほ");
  REQUIRE(normalizeDescription("ネンキン") == "年金");
  REQUIRE(normalizeDescription("ボ-ナス") == "賞与");
  REQUIRE(normalizeDescription("ｺﾞｾﾝﾀｸ ｼﾞｭｳﾐﾝ") == "税 ジュウミン");
}

TEST_CASE("normalizeDescription widens half-width katakana", "[description]") {
  REQUIRE(normalizeDescription("ｶｰﾄﾞ") == "カード");
  REQUIRE(normalizeDescription("ｶｰﾄﾞ 001") == "カード");
  REQUIRE(normalizeDescription("ﾔﾏﾀﾞ ｼｮｳｼﾞ") == "ヤマダ ショウジ");
  REQUIRE(normalizeDescription("ﾌﾘｺﾐ　ｷｭｳﾖ") == "振込 給与");
  REQUIRE(normalizeDescription("ＳＭＢＣ（１２３）") == "三井住友");
}

TEST_CASE("normalizeDescription strips OCR and branch noise", "[description]") {
  REQUIRE(normalizeDescription("振込:selected: 入金") == "振込 入金");
  REQUIRE(normalizeDescription("ＡＴＭ　引出") == "ATM 引出");
  REQUIRE(normalizeDescription("店番 123 ATM") == "ATM");
  REQUIRE(normalizeDescription("14340 10,000") == "10,000");
  REQUIRE(normalizeDescription("電気代 (123) 東京") == "電気代 東京");
}
