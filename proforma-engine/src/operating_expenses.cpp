#include "operating_expenses.hpp"
#include "errors.hpp"

namespace proforma {

ExpenseProjection project_expenses(
    const ScenarioParameters& scenario,
    const std::vector<double>& expense_esc,
    const std::vector<double>& tax_steps,
    const std::vector<double>& parking_income)
{
    const size_t n = expense_esc.size();
    if (tax_steps.size() != n || parking_income.size() != n) {
        throw InvariantViolation("Expense inputs have mismatched period counts");
    }

    ExpenseProjection exp;
    exp.fixed_opex.assign(n, 0.0);
    exp.variable_opex.assign(n, 0.0);
    exp.property_tax.assign(n, 0.0);
    exp.parking_expense.assign(n, 0.0);
    exp.capital_reserve.assign(n, 0.0);

    const double area = scenario.building_area;
    const double scale = scenario.money_scale;
    const double fixed_monthly = area * scenario.fixed_opex_per_area / 12.0 / scale;
    const double variable_monthly = area * scenario.variable_opex_per_area / 12.0 / scale;
    const double reserve_monthly = area * scenario.capital_reserve_per_area / 12.0 / scale;
    const double tax_monthly = scenario.property_tax.annual_base / 12.0;

    // Period 0 is acquisition day: no operating activity
    for (size_t t = 1; t < n; ++t) {
        exp.fixed_opex[t] = fixed_monthly * expense_esc[t];
        exp.variable_opex[t] = variable_monthly * expense_esc[t];
        exp.capital_reserve[t] = reserve_monthly * expense_esc[t];
        exp.property_tax[t] = tax_monthly * tax_steps[t];
        exp.parking_expense[t] = scenario.ancillary.parking_expense_rate * parking_income[t];
    }

    return exp;
}

double management_fee(const FeeBasis& basis, bool resolve_circular) {
    const double base = basis.potential_before_fee * (1.0 - basis.vacancy_rate) + basis.collection_loss;
    if (!resolve_circular || !basis.fee_reimbursed) {
        return basis.fee_rate * base;
    }

    const double denom = 1.0 - basis.fee_rate * (1.0 - basis.vacancy_rate);
    if (denom <= 0.0) {
        throw DivideByZeroError("Management fee fixed point has no solution (fee rate too high)");
    }
    return basis.fee_rate * base / denom;
}

} // namespace proforma
