#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace proforma {
namespace io {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

bool CsvReader::read_header() {
    header_ = read_row();
    index_.clear();
    for (size_t i = 0; i < header_.size(); ++i) {
        index_[header_[i]] = i;
    }
    return !header_.empty();
}

std::vector<std::string> CsvReader::read_row() {
    std::string line;
    while (std::getline(is_, line)) {
        ++line_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        return split(line);
    }
    return {};
}

bool CsvReader::has_more() {
    return is_.good() && is_.peek() != EOF;
}

bool CsvReader::has_column(const std::string& name) const {
    return index_.count(name) > 0;
}

size_t CsvReader::column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw ConfigParseError("CSV is missing required column: " + name);
    }
    return it->second;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delimiter_ && !quoted) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    row.push_back(trim(cell));
    return row;
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

// ============================================================================
// Cell conversions
// ============================================================================

namespace {

std::string cell_context(const std::string& column, size_t line) {
    return " in column '" + column + "' at line " + std::to_string(line);
}

} // anonymous namespace

double parse_double(const std::string& cell, const std::string& column, size_t line) {
    try {
        size_t used = 0;
        double value = std::stod(cell, &used);
        if (used != cell.size()) {
            throw ConfigParseError("Trailing characters" + cell_context(column, line));
        }
        if (!std::isfinite(value)) {
            throw ConfigParseError("Non-finite number '" + cell + "'" + cell_context(column, line));
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigParseError("Invalid number '" + cell + "'" + cell_context(column, line));
    } catch (const std::out_of_range&) {
        throw ConfigParseError("Number out of range '" + cell + "'" + cell_context(column, line));
    }
}

int parse_int(const std::string& cell, const std::string& column, size_t line) {
    try {
        size_t used = 0;
        int value = std::stoi(cell, &used);
        if (used != cell.size()) {
            throw ConfigParseError("Trailing characters" + cell_context(column, line));
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigParseError("Invalid integer '" + cell + "'" + cell_context(column, line));
    } catch (const std::out_of_range&) {
        throw ConfigParseError("Integer out of range '" + cell + "'" + cell_context(column, line));
    }
}

bool parse_bool(const std::string& cell, const std::string& column, size_t line) {
    std::string lower = cell;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "y") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0" || lower == "n" || lower.empty()) {
        return false;
    }
    throw ConfigParseError("Invalid boolean '" + cell + "'" + cell_context(column, line));
}

} // namespace io
} // namespace proforma
