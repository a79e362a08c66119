#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace importcalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    while (std::getline(is_, line)) {
        ++line_number_;
        std::string trimmed = trim(line);
        if (!trimmed.empty() && trimmed[0] == '#') {
            continue;
        }
        if (trimmed.empty()) {
            return row;
        }

        std::stringstream ss(trimmed);
        std::string cell;
        while (std::getline(ss, cell, delimiter_)) {
            row.push_back(trim(cell));
        }
        // Trailing delimiter means a final empty cell
        if (trimmed.back() == delimiter_) {
            row.emplace_back();
        }
        return row;
    }

    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

double parse_csv_number(const std::string& cell, const std::string& column) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        throw ConfigParseError("Invalid number '" + cell + "' in column " + column);
    }
    if (consumed != cell.size()) {
        throw ConfigParseError("Invalid number '" + cell + "' in column " + column);
    }
    return value;
}

double parse_csv_bound(const std::string& cell, const std::string& column) {
    std::string lower = cell;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower.empty() || lower == "inf" || lower == "infinity" || lower == "+inf") {
        return std::numeric_limits<double>::infinity();
    }
    return parse_csv_number(cell, column);
}

} // namespace importcalc
