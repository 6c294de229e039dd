#ifndef PROFORMA_RENT_ROLL_HPP
#define PROFORMA_RENT_ROLL_HPP

#include "scenario.hpp"
#include "tenant.hpp"
#include <string>
#include <vector>

namespace proforma {

// Monthly lines for one tenant, indexed by period 0..N
struct TenantProjection {
    std::string tenant_id;
    std::vector<double> revenue;         // In-place or market rent
    std::vector<double> free_rent;       // <= 0
    std::vector<double> ti_cost;         // Rollover TI, capital line
    std::vector<double> leasing_commission;
};

struct RentRollProjection {
    std::vector<TenantProjection> tenants;

    // Totals, indexed by period 0..N
    std::vector<double> tenant_revenue;
    std::vector<double> free_rent;
    std::vector<double> rental_revenue;  // tenant_revenue + free_rent
    std::vector<double> parking_income;
    std::vector<double> storage_income;
    std::vector<double> leasing_costs;   // TI + commissions

    size_t num_periods() const { return tenant_revenue.size(); }
};

// Project a single tenant's revenue and free rent over periods 0..N.
//
// For t >= max(1, lease_start):
//   t <= lease_end:                  area x in_place x esc[t] / 12
//   lease_end < t < market_start:    0 (buildout gap, rollover flag only)
//   t >= market_start:               area x market x rent_esc[t] / 12
// Free rent is the negated market revenue for free_rent_months periods
// from market_start, rollover flag only.
// esc is the tenant's own bump series when it has one, else rent_esc.
TenantProjection project_tenant(
    const Tenant& tenant,
    const std::vector<double>& rent_esc,
    double money_scale
);

// Leasing commission on a new lease signed at the given market rent.
// annual_rent is year-one market rent before free rent.
double leasing_commission(
    const Tenant& tenant,
    double annual_rent,
    double rent_growth
);

// Project every tenant plus parking and storage income over 0..N where
// N = scenario.projection_periods(). rent_esc must hold N+1 factors.
RentRollProjection project_rent_roll(
    const TenantSet& tenants,
    const ScenarioParameters& scenario,
    const std::vector<double>& rent_esc
);

} // namespace proforma

#endif // PROFORMA_RENT_ROLL_HPP
