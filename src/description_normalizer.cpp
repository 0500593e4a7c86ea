#include "description_normalizer.hpp"

#include "text_utils.hpp"

#include <regex>
#include <utility>
#include <vector>

namespace {

using Abbreviations = std::vector<std::pair<std::string, std::string>>;

// Spellings as they come off the passbook, half and full width.
const Abbreviations& printedAbbreviations() {
  static const Abbreviations kAbbreviations = {
    // banks and transfers
    {"ﾌﾘｺﾐ", "振込"}, {"フリコミ", "振込"},
    {"ﾌﾘｶｴ", "振替"}, {"フリカエ", "振替"},
    {"ﾐﾂｲｽﾐﾄﾓ", "三井住友"}, {"ミツイスミトモ", "三井住友"}, {"SMBC", "三井住友"},
    {"ﾐｽﾞﾎ", "みずほ"}, {"ミズホ", "みずほ"},
    {"ﾅﾝﾄ", "南都"}, {"ナント", "南都"},
    {"ﾕｳﾁｮ", "ゆうちょ"}, {"ユウチョ", "ゆうちょ"},
    {"ｿｳｷﾝ", "送金"}, {"ソウキン", "送金"},
    {"ﾋｷｵﾄｼ", "引落"}, {"ヒキオトシ", "引落"},
    {"ﾃｽｳﾘｮｳ", "手数料"}, {"テスウリョウ", "手数料"},
    // securities and insurance
    {"ｾｲﾒｲﾎｹﾝ", "生命保険"}, {"セイメイホケン", "生命保険"},
    {"ｼｮｳｹﾝ", "証券"}, {"ショウケン", "証券"},
    {"ﾎｹﾝ", "保険"}, {"ホケン", "保険"},
    // taxes and public money
    {"ｼｴﾝ", "支援"}, {"シエン", "支援"},
    {"ｶﾝﾌﾟ", "還付"}, {"カンプ", "還付"},
    {"ﾘｿｸ", "利息"}, {"リソク", "利息"},
    {"ｷﾝﾘ", "金利"}, {"キンリ", "金利"},
    {"ﾈﾝｷﾝ", "年金"}, {"ネンキン", "年金"},
    {"ｺﾞｾﾝﾀｸ", "税"}, {"ゼイキン", "税金"},
    // utilities
    {"ﾃﾞﾝｷ", "電気"}, {"デンキ", "電気"},
    {"ｶﾞｽ", "ガス"},
    {"ｽｲﾄﾞｳ", "水道"}, {"スイドウ", "水道"},
    // salary
    {"ｷｭｳﾖ", "給与"}, {"キュウヨ", "給与"},
    {"ﾎｳｼｭｳ", "報酬"}, {"ホウシュウ", "報酬"},
    {"ﾎﾞｰﾅｽ", "賞与"}, {"ボーナス", "賞与"}, {"ボ-ナス", "賞与"},
  };
  return kAbbreviations;
}

// The table keyed the way descriptions look after NFKC; half-width
// spellings collapse onto their full-width twins.
const Abbreviations& abbreviations() {
  static const Abbreviations kNormalized = [] {
    Abbreviations out;
    for (const auto& entry : printedAbbreviations()) {
      std::string key = toNfkc(entry.first);
      bool seen = false;
      for (const auto& existing : out) {
        if (existing.first == key) { seen = true; break; }
      }
      if (!seen) out.emplace_back(std::move(key), entry.second);
    }
    return out;
  }();
  return kNormalized;
}

std::string collapseSpaces(const std::string& text) {
  static const std::regex spaces("\\s+");
  return trim(std::regex_replace(text, spaces, " "));
}

} // namespace

std::string normalizeDescription(const std::string& raw) {
  static const std::regex branchPrefix("^(?:取扱店|取扱店番号|店番|店舗番号|取扱局)[\\s:\\-]*[0-9]+\\s*");
  static const std::regex postOfficeBranch("^[0-9]{4,5}\\s+(?=[0-9,]+)");
  static const std::regex numericBrackets("\\(\\s*[0-9]+\\s*\\)");
  static const std::regex payPay("RT.*ペイペイ");
  static const std::regex cardOnly("^カ(?:ー|-)ド(?:\\s.*)?$");
  static const std::vector<std::string> kPaymentWords = {"払込", "払込み", "払込金", "払込料"};

  std::string text = trim(raw);
  if (text.empty()) return "";

  text = toNfkc(text);
  replaceAll(text, ":selected:", "");
  text = collapseSpaces(text);
  text = trim(std::regex_replace(text, branchPrefix, "", std::regex_constants::format_first_only));
  text = trim(std::regex_replace(text, postOfficeBranch, "", std::regex_constants::format_first_only));

  for (const auto& entry : abbreviations()) {
    replaceAll(text, entry.first, entry.second);
  }

  text = collapseSpaces(std::regex_replace(text, numericBrackets, ""));

  if (std::regex_search(text, payPay)) return "RT (ペイペイ)";
  for (const auto& word : kPaymentWords) {
    if (text.find(word) != std::string::npos) return "払込み";
  }
  if (std::regex_match(text, cardOnly)) return "カード";
  return text;
}
