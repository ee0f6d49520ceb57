#pragma once

#include <optional>
#include <string>
#include <vector>

namespace posescope {

using CsvRow = std::vector<std::string>;

// Reads a delimited text file into rows of raw cells. The delimiter is a tab
// for ".tsv" files and a comma otherwise. Double-quoted cells may contain the
// delimiter and "" escapes. Blank lines are skipped.
// Throws std::runtime_error if the file cannot be opened.
std::vector<CsvRow> read_delimited(const std::string& path);

// Parses one line (exposed for tests).
CsvRow split_delimited_line(const std::string& line, char delimiter);

// Numeric cell parser; empty / non-numeric / "nan" cells yield nullopt.
std::optional<double> parse_number(const std::string& cell);

}  // namespace posescope
