#include "scenario.hpp"
#include "errors.hpp"

namespace proforma {

EscalationRates::EscalationRates()
    : rent_growth(0.0)
    , expense_growth(0.0)
    , post_stabilization_rent_growth(std::nullopt)
    , stabilization_month(0) {}

PropertyTax::PropertyTax()
    : annual_base(0.0)
    , growth(0.0)
    , start_month(1) {}

AncillaryIncome::AncillaryIncome()
    : parking_stalls(0.0)
    , parking_rate_per_stall(0.0)
    , storage_units(0.0)
    , storage_rate_per_unit(0.0)
    , parking_expense_rate(0.0) {}

ScenarioParameters::ScenarioParameters()
    : scenario_id("scenario")
    , acquisition_date()
    , hold_months(120)
    , purchase_price(0.0)
    , closing_costs(0.0)
    , building_area(0.0)
    , vacancy_rate(0.0)
    , collection_loss_rate(0.0)
    , management_fee_rate(0.0)
    , fixed_opex_per_area(0.0)
    , variable_opex_per_area(0.0)
    , capital_reserve_per_area(0.0)
    , exit_cap_rate(0.05)
    , sales_cost_rate(0.0)
    , nnn_lease(true)
    , money_scale(1000.0) {}

namespace {

void require_fraction(double value, const char* name) {
    if (!(value >= 0.0 && value < 1.0)) {
        throw ValidationError(std::string(name) + " must be in [0, 1)");
    }
}

void require_non_negative(double value, const char* name) {
    if (!(value >= 0.0)) {
        throw ValidationError(std::string(name) + " must be non-negative");
    }
}

} // anonymous namespace

void ScenarioParameters::validate() const {
    if (hold_months < 1) {
        throw ValidationError("Hold period must be at least one month");
    }
    if (!(building_area > 0.0)) {
        throw ValidationError("Building area must be positive");
    }
    if (!(money_scale > 0.0)) {
        throw ValidationError("Money scale must be positive");
    }
    require_non_negative(purchase_price, "Purchase price");
    require_non_negative(closing_costs, "Closing costs");
    require_fraction(vacancy_rate, "Vacancy rate");
    require_fraction(collection_loss_rate, "Collection loss rate");
    require_fraction(management_fee_rate, "Management fee rate");
    require_fraction(sales_cost_rate, "Sales cost rate");
    require_non_negative(fixed_opex_per_area, "Fixed opex per area");
    require_non_negative(variable_opex_per_area, "Variable opex per area");
    require_non_negative(capital_reserve_per_area, "Capital reserve per area");
    require_non_negative(property_tax.annual_base, "Property tax base");
    require_non_negative(ancillary.parking_stalls, "Parking stalls");
    require_non_negative(ancillary.parking_rate_per_stall, "Parking rate");
    require_non_negative(ancillary.storage_units, "Storage units");
    require_non_negative(ancillary.storage_rate_per_unit, "Storage rate");
    require_non_negative(ancillary.parking_expense_rate, "Parking expense rate");
    if (property_tax.start_month < 0) {
        throw ValidationError("Property tax start month must be non-negative");
    }
    if (escalation.stabilization_month < 0) {
        throw ValidationError("Stabilization month must be non-negative");
    }
    // The cap rate itself is checked at exit valuation (DivideByZeroError)
}

} // namespace proforma
