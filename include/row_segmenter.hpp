#pragma once

#include <string>
#include <vector>

enum class SegmentationStrategy {
  None,         // neither strategy produced a row
  RowCode,      // 3-digit row markers
  InlineDate,   // each date-like token opens a row
};

const char* toString(SegmentationStrategy strategy);

// Lines (or line fragments) believed to form one transaction.
struct Row {
  std::vector<std::string> lines;
};

struct Segmentation {
  SegmentationStrategy strategy = SegmentationStrategy::None;
  std::vector<Row> rows;
};

// True for a line that is exactly three ASCII digits.
bool isRowCode(const std::string& line);

// Strategy A. Each row starts with its marker line; lines before the first
// marker are dropped, and so are rows with nothing after the marker.
std::vector<Row> segmentByRowCode(const std::vector<std::string>& lines);

// Strategy B. Every D{1,4}[-/]D{1,2}[-/]D{1,2} match, with an optional
// era or D marker in front, opens a row that runs up to the next match,
// across line breaks. Text before the first match is preamble and dropped.
std::vector<Row> segmentByInlineDate(const std::vector<std::string>& lines);

// Tries A then B; the first to produce a row is used for the whole document.
Segmentation segmentRows(const std::vector<std::string>& lines);
