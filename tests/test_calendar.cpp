#include <catch2/catch_all.hpp>

#include "calendar.hpp"

#include <string>

TEST_CASE("isValidDate is strict about month lengths and leap years", "[calendar]") {
  REQUIRE(isValidDate(2020, 2, 29));
  REQUIRE_FALSE(isValidDate(2019, 2, 29));
  REQUIRE_FALSE(isValidDate(1900, 2, 29));
  REQUIRE(isValidDate(2000, 2, 29));
  REQUIRE_FALSE(isValidDate(2024, 2, 30));
  REQUIRE_FALSE(isValidDate(2024, 4, 31));
  REQUIRE_FALSE(isValidDate(2024, 13, 1));
  REQUIRE_FALSE(isValidDate(2024, 1, 0));
  REQUIRE(daysInMonth(2023, 12) == 31);
  REQUIRE(daysInMonth(2023, 0) == 0);
}

TEST_CASE("parseIsoDate accepts only valid YYYY-MM-DD", "[calendar]") {
  auto date = parseIsoDate("2019-12-06");
  REQUIRE(date.has_value());
  REQUIRE(*date == CalendarDate{2019, 12, 6});
  REQUIRE(date->toIsoString() == "2019-12-06");

  REQUIRE_FALSE(parseIsoDate("2019-2-06").has_value());
  REQUIRE_FALSE(parseIsoDate("2019-02-30").has_value());
  REQUIRE_FALSE(parseIsoDate("19-12-06").has_value());
  REQUIRE_FALSE(parseIsoDate(" 2019-12-06").has_value());
}

TEST_CASE("era offsets and names", "[calendar]") {
  REQUIRE(toGregorianYear(1, DateInterpretation::Reiwa) == 2019);
  REQUIRE(toGregorianYear(17, DateInterpretation::Heisei) == 2005);
  REQUIRE(toGregorianYear(60, DateInterpretation::Showa) == 1985);
  REQUIRE(toGregorianYear(17, DateInterpretation::Seireki) == 2017);

  REQUIRE(std::string(toString(DateInterpretation::Heisei)) == "heisei");
  REQUIRE(parseDateInterpretation("reiwa") == DateInterpretation::Reiwa);
  REQUIRE(parseDateInterpretation("showa") == DateInterpretation::Showa);
  REQUIRE_FALSE(parseDateInterpretation("Taisho").has_value());
}

TEST_CASE("toWarekiDisplay uses era boundaries", "[calendar]") {
  REQUIRE(toWarekiDisplay(CalendarDate{2024, 12, 25}) == "R6/12/25");
  REQUIRE(toWarekiDisplay(CalendarDate{2019, 1, 5}) == "R1/01/05");
  REQUIRE(toWarekiDisplay(CalendarDate{2018, 5, 1}) == "H30/05/01");
  REQUIRE(toWarekiDisplay(CalendarDate{1989, 1, 8}) == "H1/01/08");
  REQUIRE(toWarekiDisplay(CalendarDate{1985, 1, 15}) == "S60/01/15");
  REQUIRE(toWarekiDisplay(CalendarDate{1920, 3, 1}) == "1920/03/01");
}
