#ifndef PROFORMA_OPERATING_EXPENSES_HPP
#define PROFORMA_OPERATING_EXPENSES_HPP

#include "scenario.hpp"
#include <vector>

namespace proforma {

// Expense lines indexed by period 0..N. Period 0 is zero on every line.
// The management fee depends on effective revenue and is computed by the
// NOI aggregator through management_fee().
struct ExpenseProjection {
    std::vector<double> fixed_opex;
    std::vector<double> variable_opex;
    std::vector<double> property_tax;
    std::vector<double> parking_expense;
    std::vector<double> capital_reserve;

    size_t num_periods() const { return fixed_opex.size(); }
};

// expense_esc and tax_steps must hold N+1 factors; parking_income is the
// projected parking line over the same periods.
ExpenseProjection project_expenses(
    const ScenarioParameters& scenario,
    const std::vector<double>& expense_esc,
    const std::vector<double>& tax_steps,
    const std::vector<double>& parking_income
);

// Inputs to the management fee for one period
struct FeeBasis {
    double potential_before_fee;   // Potential revenue excluding the fee reimbursement
    double collection_loss;        // <= 0
    double vacancy_rate;
    double fee_rate;
    bool fee_reimbursed;           // NNN: the fee is recovered as variable reimbursement
};

// Management fee as a share of effective revenue.
//
// Without circular resolution, or when the fee is not reimbursed:
//   fee = m x (P0 (1 - v) + C)
// With circular resolution and NNN recovery, effective revenue includes
// the fee's own reimbursement and the fixed point is solved in closed form:
//   fee = m (P0 (1 - v) + C) / (1 - m (1 - v))
double management_fee(const FeeBasis& basis, bool resolve_circular);

} // namespace proforma

#endif // PROFORMA_OPERATING_EXPENSES_HPP
