#ifndef PROFORMA_IO_CSV_READER_HPP
#define PROFORMA_IO_CSV_READER_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace proforma {
namespace io {

// Line-oriented CSV reader with a header row.
// Cells are trimmed; double-quoted cells may contain the delimiter.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Reads the first non-empty line as the header. Returns false at EOF.
    bool read_header();

    // Next non-empty data row; empty vector at EOF
    std::vector<std::string> read_row();
    bool has_more();

    const std::vector<std::string>& header() const { return header_; }
    bool has_column(const std::string& name) const;

    // Column index by header name; throws ConfigParseError if absent
    size_t column(const std::string& name) const;

    // 1-based data line number of the last row read, for error messages
    size_t line_number() const { return line_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_ = 0;
    std::vector<std::string> header_;
    std::map<std::string, size_t> index_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

// Cell conversions that report the column and line on failure
double parse_double(const std::string& cell, const std::string& column, size_t line);
int parse_int(const std::string& cell, const std::string& column, size_t line);
bool parse_bool(const std::string& cell, const std::string& column, size_t line);

} // namespace io
} // namespace proforma

#endif // PROFORMA_IO_CSV_READER_HPP
