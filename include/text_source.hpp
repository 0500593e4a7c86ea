#pragma once

#include <string>
#include <vector>

// Returns full text of the PDF by invoking `pdftotext -layout` if available.
// Throws std::runtime_error on failure.
std::string extractPdfText(const std::string& pdfPath);

// Reads a whole file. Throws std::runtime_error when it cannot be opened.
std::string readTextFile(const std::string& path);

// Splits on \r?\n, trims, drops empty lines.
std::vector<std::string> splitLines(const std::string& text);

// OCR lines of a document: .pdf goes through pdftotext, anything else is
// read as UTF-8 text with one line per OCR line.
std::vector<std::string> loadDocumentLines(const std::string& path);
