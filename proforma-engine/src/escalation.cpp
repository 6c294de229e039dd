#include "escalation.hpp"
#include "errors.hpp"
#include <cmath>

namespace proforma {

namespace {

void check_inputs(int periods, double annual_rate, const char* what) {
    if (periods < 0) {
        throw ValidationError(std::string(what) + ": period count must be non-negative");
    }
    if (!(annual_rate > -1.0)) {
        throw ValidationError(std::string(what) + ": annual rate must exceed -100%");
    }
}

} // anonymous namespace

std::vector<double> rent_escalation(
    int periods,
    double annual_rate,
    std::optional<double> post_stabilization_rate,
    int stabilization_month)
{
    check_inputs(periods, annual_rate, "Rent escalation");
    if (post_stabilization_rate) {
        check_inputs(periods, *post_stabilization_rate, "Rent escalation");
    }

    std::vector<double> factors(static_cast<size_t>(periods) + 1);
    factors[0] = 1.0;
    for (int t = 1; t <= periods; ++t) {
        double rate = annual_rate;
        if (post_stabilization_rate && t > stabilization_month) {
            rate = *post_stabilization_rate;
        }
        factors[t] = factors[t - 1] * (1.0 + rate / 12.0);
    }
    return factors;
}

std::vector<double> expense_escalation(int periods, double annual_rate) {
    check_inputs(periods, annual_rate, "Expense escalation");

    const double monthly_step = std::pow(1.0 + annual_rate, 1.0 / 12.0);
    std::vector<double> factors(static_cast<size_t>(periods) + 1);
    factors[0] = 1.0;
    for (int t = 1; t <= periods; ++t) {
        factors[t] = factors[t - 1] * monthly_step;
    }
    return factors;
}

std::vector<double> property_tax_steps(int periods, double annual_growth, int tax_start_month) {
    check_inputs(periods, annual_growth, "Property tax");
    if (tax_start_month < 0) {
        throw ValidationError("Property tax: start month must be non-negative");
    }

    std::vector<double> factors(static_cast<size_t>(periods) + 1, 0.0);
    double level = 1.0;
    for (int t = tax_start_month; t <= periods; ++t) {
        int elapsed = t - tax_start_month;
        if (elapsed > 0 && elapsed % 12 == 0) {
            level *= (1.0 + annual_growth);
        }
        factors[t] = level;
    }
    return factors;
}

} // namespace proforma
