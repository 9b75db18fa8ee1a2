#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include "hypoforge/dataset/dataset.hpp"

namespace hypoforge::csv {

// Tokenizes one record. Returns false at end of input. Quoted fields may span
// lines; unquoted fields are trimmed of spaces and tabs.
bool read_record(std::istream& is, char delimiter, std::vector<std::string>& fields);

void skip_bom(std::istream& is);

// Empty cells and NA/N/A/null/none/nan (case-insensitive) count as missing.
bool is_missing_token(const std::string& token);

// Finite decimal number; integral is set when the token is a plain integer.
bool parse_number(const std::string& token, double& out, bool& integral);

// ISO-8601 date or date-time (seconds precision, optional Z) to epoch seconds.
bool parse_timestamp(const std::string& token, int64_t& epoch_seconds);

// Blank and duplicate header names become "Unnamed: i" and "name.1", "name.2".
std::vector<std::string> normalize_header(const std::vector<std::string>& header);

// Reads a delimited table with a header row and infers column kinds.
// Throws BadInputError for empty input or rows wider than the header.
Dataset parse_delimited(std::istream& is, char delimiter = ',');
Dataset read_delimited(const std::filesystem::path& path, char delimiter = ',');

} // namespace hypoforge::csv
