#include "rate_curve.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace proforma {

RateCurve::RateCurve(std::vector<RatePoint> points) {
    points_.reserve(points.size());
    for (const auto& p : points) {
        add(p.date, p.rate);
    }
}

void RateCurve::add(const Date& date, double rate) {
    if (!points_.empty() && !(points_.back().date < date)) {
        throw ValidationError("Rate curve dates must be strictly increasing at " + date.to_string());
    }
    points_.push_back({date, rate});
}

double RateCurve::get_rate(const Date& date) const {
    if (points_.empty()) {
        throw RateCurveRangeError("Rate curve is empty; no rate for " + date.to_string());
    }
    if (date < points_.front().date || date > points_.back().date) {
        throw RateCurveRangeError("Date " + date.to_string() + " outside rate curve [" +
                                  points_.front().date.to_string() + ", " +
                                  points_.back().date.to_string() + "]");
    }

    // Last point with point.date <= date
    auto it = std::upper_bound(points_.begin(), points_.end(), date,
        [](const Date& d, const RatePoint& p) { return d < p.date; });
    return std::prev(it)->rate;
}

RateCurve RateCurve::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ConfigParseError("Cannot open rate curve: " + filepath);
    }
    return load_from_csv(file);
}

RateCurve RateCurve::load_from_csv(std::istream& is) {
    RateCurve curve;
    io::CsvReader reader(is);
    if (!reader.read_header()) {
        throw ConfigParseError("Rate curve CSV is empty");
    }
    const size_t c_date = reader.column("date");
    const size_t c_rate = reader.column("rate");

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        const size_t line = reader.line_number();
        if (row.size() <= std::max(c_date, c_rate)) {
            throw ConfigParseError("Rate curve row at line " + std::to_string(line) + " is short");
        }
        curve.add(Date::parse(row[c_date]), io::parse_double(row[c_rate], "rate", line));
    }
    return curve;
}

} // namespace proforma
