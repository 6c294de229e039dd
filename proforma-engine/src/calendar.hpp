#ifndef PROFORMA_CALENDAR_HPP
#define PROFORMA_CALENDAR_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace proforma {

// Civil date stored as a day serial (days since 1970-01-01)
class Date {
public:
    Date();
    Date(int year, unsigned month, unsigned day);

    // Parse ISO "YYYY-MM-DD"; throws ValidationError on bad input
    static Date parse(const std::string& iso);
    static Date from_serial(int32_t serial);

    int32_t serial() const { return serial_; }
    int year() const;
    unsigned month() const;
    unsigned day() const;

    std::string to_string() const;

    bool operator==(const Date& other) const { return serial_ == other.serial_; }
    bool operator!=(const Date& other) const { return serial_ != other.serial_; }
    bool operator<(const Date& other) const { return serial_ < other.serial_; }
    bool operator<=(const Date& other) const { return serial_ <= other.serial_; }
    bool operator>(const Date& other) const { return serial_ > other.serial_; }
    bool operator>=(const Date& other) const { return serial_ >= other.serial_; }

private:
    int32_t serial_;
};

bool is_leap_year(int year);
unsigned days_in_month(int year, unsigned month);

// Calendar-month offset, clamped to month end (Mar-31 + 1 = Apr-30)
Date add_months(const Date& date, int months);

// Actual day count from a to b (negative if b precedes a)
int32_t days_between(const Date& a, const Date& b);

// Period dates 0..num_months, each offset from start (never chained)
std::vector<Date> generate_monthly_dates(const Date& start, int num_months);

} // namespace proforma

#endif // PROFORMA_CALENDAR_HPP
