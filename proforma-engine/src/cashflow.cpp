#include "cashflow.hpp"
#include "errors.hpp"

namespace proforma {

std::vector<double> CashFlowTable::unlevered() const {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        out.push_back(r.unlevered_cf);
    }
    return out;
}

std::vector<double> CashFlowTable::levered() const {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        out.push_back(r.levered_cf);
    }
    return out;
}

std::vector<Date> CashFlowTable::dates() const {
    std::vector<Date> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        out.push_back(r.date);
    }
    return out;
}

CashFlowTable assemble_cash_flows(
    const ScenarioParameters& scenario,
    const std::vector<Date>& dates,
    const RentRollProjection& revenue,
    const ExpenseProjection& expenses,
    const NoiProjection& noi,
    const DebtSchedule& debt,
    const ExitValuation& exit)
{
    const int hold = scenario.hold_months;
    const size_t rows_needed = static_cast<size_t>(hold) + 1;
    if (dates.size() < rows_needed || revenue.num_periods() < rows_needed ||
        expenses.num_periods() < rows_needed || noi.num_periods() < rows_needed) {
        throw InvariantViolation("Projections are shorter than the hold period");
    }
    if (exit.exit_period != hold) {
        throw InvariantViolation("Exit valuation is not at the end of the hold");
    }

    CashFlowTable table;
    table.rows.reserve(rows_needed);

    for (int t = 0; t <= hold; ++t) {
        MonthlyRow r{};
        r.period = t;
        r.date = dates[t];

        r.tenant_revenue = revenue.tenant_revenue[t];
        r.free_rent = revenue.free_rent[t];
        r.parking_income = revenue.parking_income[t];
        r.storage_income = revenue.storage_income[t];
        r.fixed_reimbursement = noi.fixed_reimbursement[t];
        r.variable_reimbursement = noi.variable_reimbursement[t];
        r.potential_revenue = noi.potential_revenue[t];
        r.vacancy = noi.vacancy[t];
        r.collection_loss = noi.collection_loss[t];
        r.effective_revenue = noi.effective_revenue[t];

        r.fixed_opex = expenses.fixed_opex[t];
        r.variable_opex = expenses.variable_opex[t];
        r.property_tax = expenses.property_tax[t];
        r.parking_expense = expenses.parking_expense[t];
        r.management_fee = noi.management_fee[t];
        r.capital_reserve = expenses.capital_reserve[t];
        r.total_expenses = noi.total_expenses[t];
        r.noi = noi.noi[t];

        r.acquisition_cost = (t == 0) ? scenario.total_acquisition_cost() : 0.0;
        r.leasing_costs = revenue.leasing_costs[t];
        r.exit_proceeds = (t == hold) ? exit.net_proceeds : 0.0;
        r.unlevered_cf = r.noi + r.exit_proceeds - r.acquisition_cost - r.leasing_costs;

        if (!debt.empty()) {
            const DebtPeriod& d = debt.at(t);
            r.loan_draws = d.draws;
            r.interest = d.interest;
            r.principal = d.principal_paydown;
            r.debt_service = d.debt_service;
            r.loan_fees = d.fees;
            r.loan_payoff = (t == hold) ? debt.payoff(hold) : 0.0;
            r.ending_loan_balance = d.ending_balance - r.loan_payoff;
        }
        r.levered_cf = r.unlevered_cf + r.loan_draws - r.debt_service - r.loan_fees - r.loan_payoff;
        r.operating_levered_cf = r.noi - r.debt_service - r.leasing_costs;

        table.rows.push_back(r);
    }

    table.annual = roll_up_annual(table.rows);
    return table;
}

std::vector<AnnualRow> roll_up_annual(const std::vector<MonthlyRow>& rows) {
    std::vector<AnnualRow> annual;
    for (const auto& r : rows) {
        // Periods 1..12 are year 1; period 0 (acquisition) also opens year 1
        const int bucket = (r.period == 0) ? 1 : (r.period + 11) / 12;
        while (static_cast<int>(annual.size()) < bucket) {
            AnnualRow a{};
            a.year = static_cast<int>(annual.size()) + 1;
            annual.push_back(a);
        }
        AnnualRow& a = annual[bucket - 1];
        a.potential_revenue += r.potential_revenue;
        a.effective_revenue += r.effective_revenue;
        a.total_expenses += r.total_expenses;
        a.noi += r.noi;
        a.debt_service += r.debt_service;
        a.leasing_costs += r.leasing_costs;
        a.unlevered_cf += r.unlevered_cf;
        a.levered_cf += r.levered_cf;
        a.operating_levered_cf += r.operating_levered_cf;
    }
    return annual;
}

} // namespace proforma
