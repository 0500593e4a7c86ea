#include "text_source.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace {

bool commandExists(const std::string& command) {
  std::string probe = "command -v " + command + " >/dev/null 2>&1";
  return std::system(probe.c_str()) == 0;
}

// Runs a shell command and returns everything it wrote to stdout.
std::string captureCommandOutput(const std::string& cmd, const std::string& what) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("Cannot start pdftotext for " + what);
  }

  std::string output;
  char chunk[4096];
  size_t n = 0;
  while ((n = std::fread(chunk, 1, sizeof(chunk), pipe)) > 0) {
    output.append(chunk, n);
  }

  if (pclose(pipe) != 0) {
    throw std::runtime_error("pdftotext failed on " + what);
  }
  return output;
}

bool hasPdfExtension(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".pdf";
}

} // namespace

std::string extractPdfText(const std::string& pdfPath) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
  // -layout keeps the passbook columns on one line per row.
  const std::string cmd = "pdftotext -layout -nopgbrk -enc UTF-8 -q \"" + pdfPath + "\" -";
  return captureCommandOutput(cmd, pdfPath);
}

std::string readTextFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot open " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::regex lineBreak("\r?\n");
  std::sregex_token_iterator it(text.begin(), text.end(), lineBreak, -1);
  std::sregex_token_iterator end;
  for (; it != end; ++it) {
    std::string line = trim(*it);
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> loadDocumentLines(const std::string& path) {
  if (hasPdfExtension(path)) {
    return splitLines(extractPdfText(path));
  }
  return splitLines(readTextFile(path));
}
