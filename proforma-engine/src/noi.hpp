#ifndef PROFORMA_NOI_HPP
#define PROFORMA_NOI_HPP

#include "operating_expenses.hpp"
#include "rent_roll.hpp"
#include "scenario.hpp"
#include <vector>

namespace proforma {

// Revenue build-up and NOI, indexed by period 0..N
struct NoiProjection {
    std::vector<double> fixed_reimbursement;     // fixed opex + tax (NNN)
    std::vector<double> variable_reimbursement;  // variable opex + parking expense + fee (NNN)
    std::vector<double> potential_revenue;
    std::vector<double> vacancy;                 // <= 0
    std::vector<double> collection_loss;         // <= 0
    std::vector<double> effective_revenue;
    std::vector<double> management_fee;
    std::vector<double> total_expenses;          // Opex, tax, parking, fee, reserve
    std::vector<double> noi;

    size_t num_periods() const { return noi.size(); }
};

// Combine rent roll and expenses into NOI.
// resolve_circular selects how the management fee and its reimbursement
// are resolved (see management_fee()).
NoiProjection aggregate_noi(
    const ScenarioParameters& scenario,
    const RentRollProjection& revenue,
    const ExpenseProjection& expenses,
    bool resolve_circular
);

} // namespace proforma

#endif // PROFORMA_NOI_HPP
