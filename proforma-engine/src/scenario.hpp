#ifndef PROFORMA_SCENARIO_HPP
#define PROFORMA_SCENARIO_HPP

#include "calendar.hpp"
#include <optional>
#include <string>

namespace proforma {

// Number of rows past the exit period used only for forward NOI
constexpr int kForwardPeriods = 12;

struct EscalationRates {
    double rent_growth;                          // Annual rent growth, monthly compounding
    double expense_growth;                       // Annual expense growth, monthly root
    std::optional<double> post_stabilization_rent_growth;
    int stabilization_month;                     // Last period at the base rent rate

    EscalationRates();
};

struct PropertyTax {
    double annual_base;                          // Year-one tax, money units
    double growth;                               // Step applied every 12 periods
    int start_month;                             // First taxed period (default 1)

    PropertyTax();
};

// Monthly rates in whole currency, scaled by rent escalation
struct AncillaryIncome {
    double parking_stalls;
    double parking_rate_per_stall;
    double storage_units;
    double storage_rate_per_unit;
    double parking_expense_rate;                 // Share of parking income

    AncillaryIncome();
};

// Property-level scenario inputs. Lump amounts are in money units
// (thousands with the default scale); per-area rates are annual whole
// currency and are divided by money_scale when projected.
struct ScenarioParameters {
    std::string scenario_id;
    Date acquisition_date;
    int hold_months;

    double purchase_price;
    double closing_costs;
    double building_area;

    double vacancy_rate;
    double collection_loss_rate;                 // Applied to rental revenue only
    double management_fee_rate;                  // Applied to effective revenue

    double fixed_opex_per_area;
    double variable_opex_per_area;
    double capital_reserve_per_area;

    PropertyTax property_tax;
    EscalationRates escalation;
    AncillaryIncome ancillary;

    double exit_cap_rate;
    double sales_cost_rate;

    bool nnn_lease;                              // Tenants reimburse opex and tax
    double money_scale;

    ScenarioParameters();

    double total_acquisition_cost() const { return purchase_price + closing_costs; }

    // Projection length including the forward buffer
    int projection_periods() const { return hold_months + kForwardPeriods; }

    // Throws ValidationError
    void validate() const;
};

} // namespace proforma

#endif // PROFORMA_SCENARIO_HPP
