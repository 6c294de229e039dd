#ifndef PROFORMA_RATE_CURVE_HPP
#define PROFORMA_RATE_CURVE_HPP

#include "calendar.hpp"
#include <istream>
#include <string>
#include <vector>

namespace proforma {

struct RatePoint {
    Date date;
    double rate;  // annual index rate, decimal
};

// Step curve of index rates ordered by date. The rate for a date is that of
// the latest point on or before it; dates outside [first, last] are not
// extrapolated.
class RateCurve {
public:
    RateCurve() = default;
    explicit RateCurve(std::vector<RatePoint> points);

    // Points must have strictly increasing dates; throws ValidationError
    void add(const Date& date, double rate);

    // Throws RateCurveRangeError outside the curve
    double get_rate(const Date& date) const;

    bool empty() const { return points_.empty(); }
    size_t size() const { return points_.size(); }
    const std::vector<RatePoint>& points() const { return points_; }

    // CSV with columns date,rate
    static RateCurve load_from_csv(const std::string& filepath);
    static RateCurve load_from_csv(std::istream& is);

private:
    std::vector<RatePoint> points_;
};

} // namespace proforma

#endif // PROFORMA_RATE_CURVE_HPP
