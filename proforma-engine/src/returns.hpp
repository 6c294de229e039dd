#ifndef PROFORMA_RETURNS_HPP
#define PROFORMA_RETURNS_HPP

#include "calendar.hpp"
#include <cmath>
#include <vector>

namespace proforma {

struct SolverOptions {
    double initial_guess;       // Newton starting rate
    double tolerance;           // Stop when |rate update| < tolerance
    int max_iterations;         // Newton iteration cap
    double lower_bound;         // Bisection bracket
    double upper_bound;

    SolverOptions();
};

// Sum of cf[t] / (1 + rate)^t, cf[0] undiscounted
double npv(double rate, const std::vector<double>& cash_flows);

// Sum of cf[i] / (1 + rate)^((d[i] - d[0]) / 365)
double xnpv(double rate, const std::vector<double>& cash_flows, const std::vector<Date>& dates);

// Date-weighted IRR (annual). Newton first, then bisection over
// [lower_bound, upper_bound]; throws ConvergenceError when neither finds a
// root. Fewer than two flows, or flows that never change sign, throw
// DegenerateCashFlowError. Dates must be strictly increasing and match
// the flows in length (ValidationError).
double xirr(
    const std::vector<double>& cash_flows,
    const std::vector<Date>& dates,
    const SolverOptions& options = SolverOptions()
);

// Per-period IRR on equally spaced flows. Same failure modes as xirr().
double irr(const std::vector<double>& cash_flows, const SolverOptions& options = SolverOptions());

inline double annualize_monthly_rate(double monthly_rate) {
    return std::pow(1.0 + monthly_rate, 12.0) - 1.0;
}

// Total inflows over total outflows; no outflows is degenerate
double equity_multiple(const std::vector<double>& cash_flows);

double profit(const std::vector<double>& cash_flows);

// Operating cash flow of each year over equity invested
std::vector<double> cash_on_cash(const std::vector<double>& annual_operating_cf, double equity);

double average(const std::vector<double>& values);

} // namespace proforma

#endif // PROFORMA_RETURNS_HPP
