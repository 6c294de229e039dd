#ifndef PROFORMA_TENANT_HPP
#define PROFORMA_TENANT_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace proforma {

// One rent-roll line. Rents and allowances are annual amounts per unit of
// area, in whole currency; the projectors apply the scenario money scale.
struct Tenant {
    std::string id;
    double area = 0.0;
    double in_place_rent = 0.0;
    double market_rent = 0.0;
    int lease_start_month = 0;
    int lease_end_month = 0;

    // Rollover cost flag: buildout gap, free rent and leasing costs apply
    bool rollover_costs = false;
    int ti_buildout_months = 0;
    int free_rent_months = 0;

    // Tenant-specific in-place escalation; scenario rent rate when absent
    std::optional<double> rent_bump_rate;

    double ti_allowance_per_area = 0.0;
    double lc_rate_years_1_5 = 0.0;
    double lc_rate_years_6_plus = 0.0;
    int new_lease_term_years = 10;

    // Rollover period: first period after the in-place lease
    int rollover_month() const { return lease_end_month + 1; }

    // First period at market rent
    int market_start_month() const {
        return lease_end_month + 1 + (rollover_costs ? ti_buildout_months : 0);
    }

    // Throws ValidationError
    void validate() const;
};

class TenantSet {
public:
    void add(const Tenant& tenant);
    void add(Tenant&& tenant);

    const Tenant& get(size_t index) const;
    size_t size() const { return tenants_.size(); }
    bool empty() const { return tenants_.empty(); }

    const std::vector<Tenant>& tenants() const { return tenants_; }

    double total_area() const;

    // Validates each tenant, unique ids, and that areas sum to building_area
    // within a relative 1e-6.
    void validate(double building_area) const;

    // Columns: id, area, in_place_rent, market_rent, lease_end_month,
    // rollover_costs; optional lease_start_month, ti_buildout_months,
    // free_rent_months, rent_bump_rate, ti_allowance_per_area,
    // lc_rate_years_1_5, lc_rate_years_6_plus, new_lease_term_years
    static TenantSet load_from_csv(const std::string& filepath);
    static TenantSet load_from_csv(std::istream& is);

private:
    std::vector<Tenant> tenants_;
};

} // namespace proforma

#endif // PROFORMA_TENANT_HPP
