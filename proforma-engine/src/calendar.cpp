#include "calendar.hpp"
#include "errors.hpp"
#include <cstdio>
#include <sstream>

namespace proforma {

namespace {

// Howard Hinnant's days_from_civil / civil_from_days
int32_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int32_t>(doe) - 719468;
}

void civil_from_days(int32_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + era * 400 + (m <= 2);
}

} // anonymous namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw ValidationError("Month must be between 1 and 12");
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

Date::Date() : serial_(0) {}

Date::Date(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        std::ostringstream oss;
        oss << "Invalid calendar date: " << year << "-" << month << "-" << day;
        throw ValidationError(oss.str());
    }
    serial_ = days_from_civil(year, month, day);
}

Date Date::from_serial(int32_t serial) {
    Date d;
    d.serial_ = serial;
    return d;
}

Date Date::parse(const std::string& iso) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char dash1 = 0;
    char dash2 = 0;
    std::istringstream iss(iso);
    if (!(iss >> y >> dash1 >> m >> dash2 >> d) || dash1 != '-' || dash2 != '-') {
        throw ValidationError("Invalid ISO date (expected YYYY-MM-DD): " + iso);
    }
    return Date(y, m, d);
}

int Date::year() const {
    int y;
    unsigned m, d;
    civil_from_days(serial_, y, m, d);
    return y;
}

unsigned Date::month() const {
    int y;
    unsigned m, d;
    civil_from_days(serial_, y, m, d);
    return m;
}

unsigned Date::day() const {
    int y;
    unsigned m, d;
    civil_from_days(serial_, y, m, d);
    return d;
}

std::string Date::to_string() const {
    int y;
    unsigned m, d;
    civil_from_days(serial_, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return std::string(buf);
}

Date add_months(const Date& date, int months) {
    int y;
    unsigned m, d;
    civil_from_days(date.serial(), y, m, d);

    int total = y * 12 + static_cast<int>(m) - 1 + months;
    int new_year = total >= 0 ? total / 12 : (total - 11) / 12;
    unsigned new_month = static_cast<unsigned>(total - new_year * 12) + 1;
    unsigned last_day = days_in_month(new_year, new_month);

    return Date(new_year, new_month, d < last_day ? d : last_day);
}

int32_t days_between(const Date& a, const Date& b) {
    return b.serial() - a.serial();
}

std::vector<Date> generate_monthly_dates(const Date& start, int num_months) {
    if (num_months < 0) {
        throw ValidationError("Number of months must be non-negative");
    }
    std::vector<Date> dates;
    dates.reserve(static_cast<size_t>(num_months) + 1);
    for (int i = 0; i <= num_months; ++i) {
        dates.push_back(add_months(start, i));
    }
    return dates;
}

} // namespace proforma
