#ifndef IMPORTCALC_CSV_READER_HPP
#define IMPORTCALC_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace importcalc {

// Line-oriented CSV reader for schedule and comparables tables.
// Lines starting with '#' are skipped; cells are whitespace-trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-comment row; empty when the stream is exhausted or the line is blank
    std::vector<std::string> read_row();
    bool has_more() const;

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

// Parse a numeric cell; throws ConfigParseError naming the column
double parse_csv_number(const std::string& cell, const std::string& column);

// Like parse_csv_number, but "inf", "infinity" and empty cells are unbounded
double parse_csv_bound(const std::string& cell, const std::string& column);

} // namespace importcalc

#endif // IMPORTCALC_CSV_READER_HPP
