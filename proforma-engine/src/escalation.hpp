#ifndef PROFORMA_ESCALATION_HPP
#define PROFORMA_ESCALATION_HPP

#include <optional>
#include <vector>

namespace proforma {

// Rent escalation: monthly compounding, factor[t] = factor[t-1] * (1 + r/12).
// Once t exceeds stabilization_month the post-stabilization rate (if given)
// replaces the base rate.
// Returns periods+1 factors with factor[0] = 1.0.
std::vector<double> rent_escalation(
    int periods,
    double annual_rate,
    std::optional<double> post_stabilization_rate = std::nullopt,
    int stabilization_month = 0
);

// Expense escalation: annual rate at a monthly root,
// factor[t] = factor[t-1] * (1 + r)^(1/12).
// After 12 periods this is exactly (1 + r); rent escalation is not.
std::vector<double> expense_escalation(int periods, double annual_rate);

// Property tax steps: 0 before tax_start_month, 1.0 for the 12 periods
// starting at tax_start_month, then times (1 + growth) once per 12-period
// boundary.
std::vector<double> property_tax_steps(int periods, double annual_growth, int tax_start_month = 1);

} // namespace proforma

#endif // PROFORMA_ESCALATION_HPP
