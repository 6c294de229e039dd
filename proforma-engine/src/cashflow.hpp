#ifndef PROFORMA_CASHFLOW_HPP
#define PROFORMA_CASHFLOW_HPP

#include "calendar.hpp"
#include "debt_schedule.hpp"
#include "exit_valuation.hpp"
#include "noi.hpp"
#include "operating_expenses.hpp"
#include "rent_roll.hpp"
#include "scenario.hpp"
#include <vector>

namespace proforma {

// One period of the output table. Built once per run and never mutated.
struct MonthlyRow {
    int period;
    Date date;

    // Revenue
    double tenant_revenue;
    double free_rent;
    double parking_income;
    double storage_income;
    double fixed_reimbursement;
    double variable_reimbursement;
    double potential_revenue;
    double vacancy;
    double collection_loss;
    double effective_revenue;

    // Expenses
    double fixed_opex;
    double variable_opex;
    double property_tax;
    double parking_expense;
    double management_fee;
    double capital_reserve;
    double total_expenses;
    double noi;

    // Capital and debt
    double acquisition_cost;
    double leasing_costs;
    double exit_proceeds;
    double unlevered_cf;
    double loan_draws;
    double interest;
    double principal;
    double debt_service;
    double loan_fees;
    double loan_payoff;
    double ending_loan_balance;
    double levered_cf;
    double operating_levered_cf;  // NOI - debt service - leasing costs
};

// Hold-year roll-up; periods 1..12 are year 1 and period 0 joins year 1
struct AnnualRow {
    int year;
    double potential_revenue;
    double effective_revenue;
    double total_expenses;
    double noi;
    double debt_service;
    double leasing_costs;
    double unlevered_cf;
    double levered_cf;
    double operating_levered_cf;
};

struct CashFlowTable {
    std::vector<MonthlyRow> rows;   // Periods 0..hold only
    std::vector<AnnualRow> annual;

    std::vector<double> unlevered() const;
    std::vector<double> levered() const;
    std::vector<Date> dates() const;
};

// Merge the projections into rows 0..hold:
//   unlevered = NOI + exit proceeds - acquisition (t = 0) - leasing costs
//   levered   = unlevered + draws - debt service - loan fees - payoff (t = hold)
// Forward rows past the hold feed the exit value and are not surfaced.
CashFlowTable assemble_cash_flows(
    const ScenarioParameters& scenario,
    const std::vector<Date>& dates,
    const RentRollProjection& revenue,
    const ExpenseProjection& expenses,
    const NoiProjection& noi,
    const DebtSchedule& debt,
    const ExitValuation& exit
);

std::vector<AnnualRow> roll_up_annual(const std::vector<MonthlyRow>& rows);

} // namespace proforma

#endif // PROFORMA_CASHFLOW_HPP
