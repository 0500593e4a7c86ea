#include "row_segmenter.hpp"

#include "text_utils.hpp"

#include <regex>
#include <utility>

namespace {

const std::regex& inlineDatePattern() {
  // Optional era or date marker in front, kept with the date.
  static const std::regex re("(?:[RHSDrhsd]|令|平|昭)?[0-9]{1,4}[-/][0-9]{1,2}[-/][0-9]{1,2}");
  return re;
}

bool hasContent(const Row& row) {
  for (const auto& line : row.lines) {
    if (!trim(line).empty()) return true;
  }
  return false;
}

void appendFragment(Row& row, const std::string& fragment) {
  std::string text = trim(fragment);
  if (!text.empty()) row.lines.push_back(std::move(text));
}

} // namespace

const char* toString(SegmentationStrategy strategy) {
  switch (strategy) {
    case SegmentationStrategy::None: return "none";
    case SegmentationStrategy::RowCode: return "row_code";
    case SegmentationStrategy::InlineDate: return "inline_date";
  }
  return "none";
}

bool isRowCode(const std::string& line) {
  std::string t = trim(line);
  return t.size() == 3 && isAsciiDigits(t);
}

std::vector<Row> segmentByRowCode(const std::vector<std::string>& lines) {
  enum class State { NoRow, InRow };

  std::vector<Row> rows;
  State state = State::NoRow;
  Row current;

  auto flush = [&]() {
    if (state == State::InRow) rows.push_back(std::move(current));
    current = Row{};
  };

  for (const auto& raw : lines) {
    std::string line = trim(raw);
    if (line.empty()) continue;
    if (isRowCode(line)) {
      flush();
      current.lines.push_back(line);
      state = State::InRow;
      continue;
    }
    if (state == State::InRow) current.lines.push_back(line);
  }
  flush();

  std::vector<Row> kept;
  for (auto& row : rows) {
    if (row.lines.size() < 2 || !isRowCode(row.lines.front())) continue;
    kept.push_back(std::move(row));
  }
  return kept;
}

std::vector<Row> segmentByInlineDate(const std::vector<std::string>& lines) {
  std::vector<Row> rows;
  bool open = false;
  Row current;

  for (const auto& line : lines) {
    size_t cursor = 0;
    auto begin = std::sregex_iterator(line.begin(), line.end(), inlineDatePattern());
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
      size_t start = static_cast<size_t>(it->position());
      if (open) {
        appendFragment(current, line.substr(cursor, start - cursor));
        if (hasContent(current)) rows.push_back(std::move(current));
        current = Row{};
      }
      open = true;
      // The date is its own fragment so text glued to it tokenizes apart.
      appendFragment(current, it->str());
      cursor = start + static_cast<size_t>(it->length());
    }
    if (open) appendFragment(current, line.substr(cursor));
  }
  if (open && hasContent(current)) rows.push_back(std::move(current));
  return rows;
}

Segmentation segmentRows(const std::vector<std::string>& lines) {
  Segmentation result;
  result.rows = segmentByRowCode(lines);
  if (!result.rows.empty()) {
    result.strategy = SegmentationStrategy::RowCode;
    return result;
  }
  result.rows = segmentByInlineDate(lines);
  if (!result.rows.empty()) result.strategy = SegmentationStrategy::InlineDate;
  return result;
}
