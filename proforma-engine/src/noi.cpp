#include "noi.hpp"
#include "errors.hpp"

namespace proforma {

NoiProjection aggregate_noi(
    const ScenarioParameters& scenario,
    const RentRollProjection& revenue,
    const ExpenseProjection& expenses,
    bool resolve_circular)
{
    const size_t n = revenue.num_periods();
    if (expenses.num_periods() != n) {
        throw InvariantViolation("Revenue and expense projections have different lengths");
    }

    NoiProjection out;
    out.fixed_reimbursement.assign(n, 0.0);
    out.variable_reimbursement.assign(n, 0.0);
    out.potential_revenue.assign(n, 0.0);
    out.vacancy.assign(n, 0.0);
    out.collection_loss.assign(n, 0.0);
    out.effective_revenue.assign(n, 0.0);
    out.management_fee.assign(n, 0.0);
    out.total_expenses.assign(n, 0.0);
    out.noi.assign(n, 0.0);

    const double v = scenario.vacancy_rate;
    const bool nnn = scenario.nnn_lease;

    for (size_t t = 1; t < n; ++t) {
        double fixed_reimb = 0.0;
        double variable_reimb = 0.0;
        if (nnn) {
            fixed_reimb = expenses.fixed_opex[t] + expenses.property_tax[t];
            variable_reimb = expenses.variable_opex[t] + expenses.parking_expense[t];
        }

        const double p0 = revenue.rental_revenue[t] + revenue.parking_income[t] +
                          revenue.storage_income[t] + fixed_reimb + variable_reimb;
        const double collection = -scenario.collection_loss_rate * revenue.rental_revenue[t];

        FeeBasis basis{p0, collection, v, scenario.management_fee_rate, nnn};
        const double fee = management_fee(basis, resolve_circular);

        double potential = p0;
        double vacancy = -v * p0;
        if (nnn) {
            variable_reimb += fee;
            potential += fee;
            // The circular solution carries vacancy on the fee reimbursement too
            if (resolve_circular) {
                vacancy = -v * potential;
            }
        }

        out.fixed_reimbursement[t] = fixed_reimb;
        out.variable_reimbursement[t] = variable_reimb;
        out.potential_revenue[t] = potential;
        out.vacancy[t] = vacancy;
        out.collection_loss[t] = collection;
        out.effective_revenue[t] = potential + vacancy + collection;
        out.management_fee[t] = fee;
        out.total_expenses[t] = expenses.fixed_opex[t] + expenses.variable_opex[t] +
                                expenses.property_tax[t] + expenses.parking_expense[t] +
                                fee + expenses.capital_reserve[t];
        out.noi[t] = out.effective_revenue[t] - out.total_expenses[t];
    }

    return out;
}

} // namespace proforma
