#include "rent_roll.hpp"
#include "escalation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace proforma {

TenantProjection project_tenant(
    const Tenant& tenant,
    const std::vector<double>& rent_esc,
    double money_scale)
{
    if (rent_esc.empty()) {
        throw ValidationError("Rent escalation series is empty");
    }
    const int last = static_cast<int>(rent_esc.size()) - 1;

    std::vector<double> own_esc;
    if (tenant.rent_bump_rate) {
        own_esc = rent_escalation(last, *tenant.rent_bump_rate);
    }
    const std::vector<double>& in_place_esc = tenant.rent_bump_rate ? own_esc : rent_esc;

    TenantProjection proj;
    proj.tenant_id = tenant.id;
    proj.revenue.assign(rent_esc.size(), 0.0);
    proj.free_rent.assign(rent_esc.size(), 0.0);
    proj.ti_cost.assign(rent_esc.size(), 0.0);
    proj.leasing_commission.assign(rent_esc.size(), 0.0);

    const double in_place_monthly = tenant.area * tenant.in_place_rent / 12.0 / money_scale;
    const double market_monthly = tenant.area * tenant.market_rent / 12.0 / money_scale;
    const int market_start = tenant.market_start_month();
    const int free_end = market_start + (tenant.rollover_costs ? tenant.free_rent_months : 0);

    for (int t = std::max(1, tenant.lease_start_month); t <= last; ++t) {
        if (t <= tenant.lease_end_month) {
            proj.revenue[t] = in_place_monthly * in_place_esc[t];
        } else if (t >= market_start) {
            proj.revenue[t] = market_monthly * rent_esc[t];
            if (t < free_end) {
                proj.free_rent[t] = -proj.revenue[t];
            }
        }
    }

    return proj;
}

double leasing_commission(
    const Tenant& tenant,
    double annual_rent,
    double rent_growth)
{
    double total = 0.0;
    const double free_share = std::min(tenant.free_rent_months, 12) / 12.0;
    for (int year = 1; year <= tenant.new_lease_term_years; ++year) {
        double rent = annual_rent * std::pow(1.0 + rent_growth, year - 1);
        if (year == 1) {
            rent *= (1.0 - free_share);
        }
        const double rate = (year <= 5) ? tenant.lc_rate_years_1_5 : tenant.lc_rate_years_6_plus;
        total += rent * rate;
    }
    return total;
}

RentRollProjection project_rent_roll(
    const TenantSet& tenants,
    const ScenarioParameters& scenario,
    const std::vector<double>& rent_esc)
{
    const size_t n = static_cast<size_t>(scenario.projection_periods()) + 1;
    if (rent_esc.size() != n) {
        throw InvariantViolation("Rent escalation has " + std::to_string(rent_esc.size()) +
                                 " factors, expected " + std::to_string(n));
    }

    RentRollProjection roll;
    roll.tenant_revenue.assign(n, 0.0);
    roll.free_rent.assign(n, 0.0);
    roll.rental_revenue.assign(n, 0.0);
    roll.parking_income.assign(n, 0.0);
    roll.storage_income.assign(n, 0.0);
    roll.leasing_costs.assign(n, 0.0);

    for (const auto& tenant : tenants.tenants()) {
        TenantProjection proj = project_tenant(tenant, rent_esc, scenario.money_scale);

        // Rollover leasing costs land once, in the rollover period
        const int rollover = tenant.rollover_month();
        if (tenant.rollover_costs && rollover >= 1 && rollover <= scenario.hold_months) {
            const double esc = rent_esc[rollover];
            proj.ti_cost[rollover] =
                tenant.area * tenant.ti_allowance_per_area * esc / scenario.money_scale;
            const double annual_market = tenant.area * tenant.market_rent * esc / scenario.money_scale;
            proj.leasing_commission[rollover] =
                leasing_commission(tenant, annual_market, scenario.escalation.rent_growth);
        }

        for (size_t t = 0; t < n; ++t) {
            roll.tenant_revenue[t] += proj.revenue[t];
            roll.free_rent[t] += proj.free_rent[t];
            roll.leasing_costs[t] += proj.ti_cost[t] + proj.leasing_commission[t];
        }
        roll.tenants.push_back(std::move(proj));
    }

    const auto& anc = scenario.ancillary;
    const double parking_monthly = anc.parking_stalls * anc.parking_rate_per_stall / scenario.money_scale;
    const double storage_monthly = anc.storage_units * anc.storage_rate_per_unit / scenario.money_scale;

    for (size_t t = 1; t < n; ++t) {
        roll.rental_revenue[t] = roll.tenant_revenue[t] + roll.free_rent[t];
        roll.parking_income[t] = parking_monthly * rent_esc[t];
        roll.storage_income[t] = storage_monthly * rent_esc[t];
    }

    return roll;
}

} // namespace proforma
