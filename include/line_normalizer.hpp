#pragma once

#include <string>
#include <vector>

// Canonicalizes OCR punctuation and spacing in one line. Idempotent.
//   dash variants (− ― ー – — －) -> '-'
//   ／ -> '/'
//   ： ； -> '-'
//   middle dots and asterisks removed
//   whitespace runs (including U+3000) collapsed to one space
//   spaces around '-' and before ':' / ',' removed, repeated '-' collapsed
std::string normalizeLine(const std::string& line);

// Normalizes every line and drops the ones that end up blank.
std::vector<std::string> normalizeLines(const std::vector<std::string>& lines);
