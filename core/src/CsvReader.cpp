#include "posescope/CsvReader.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace posescope {

CsvRow split_delimited_line(const std::string& line, char delimiter) {
    CsvRow cells;
    std::string cell;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter) {
            cells.push_back(std::move(cell));
            cell.clear();
        } else if (c != '\r') {
            cell.push_back(c);
        }
    }
    cells.push_back(std::move(cell));
    return cells;
}

std::vector<CsvRow> read_delimited(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open delimited file: " + path);
    }
    const char delimiter = std::filesystem::path(path).extension() == ".tsv" ? '\t' : ',';

    std::vector<CsvRow> rows;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        rows.push_back(split_delimited_line(line, delimiter));
    }
    return rows;
}

std::optional<double> parse_number(const std::string& cell) {
    const auto b = cell.find_first_not_of(" \t");
    if (b == std::string::npos) return std::nullopt;
    const char* begin = cell.c_str() + b;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE) return std::nullopt;
    for (const char* p = end; *p; ++p) {
        if (*p != ' ' && *p != '\t') return std::nullopt;
    }
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

}  // namespace posescope
