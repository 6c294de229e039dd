#include "tenant.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>

namespace proforma {

void Tenant::validate() const {
    const std::string who = "Tenant '" + id + "': ";
    if (id.empty()) {
        throw ValidationError("Tenant id must not be empty");
    }
    if (!(area > 0.0) || !std::isfinite(area)) {
        throw ValidationError(who + "area must be positive and finite");
    }
    if (!std::isfinite(in_place_rent) || !std::isfinite(market_rent)) {
        throw ValidationError(who + "rents must be finite");
    }
    if (in_place_rent < 0.0 || market_rent < 0.0) {
        throw ValidationError(who + "rents must be non-negative");
    }
    if (lease_start_month < 0) {
        throw ValidationError(who + "lease start must be non-negative");
    }
    if (lease_end_month < lease_start_month) {
        throw ValidationError(who + "lease end precedes lease start");
    }
    if (ti_buildout_months < 0 || free_rent_months < 0) {
        throw ValidationError(who + "buildout and free-rent months must be non-negative");
    }
    if (rent_bump_rate && !(*rent_bump_rate > -1.0 && std::isfinite(*rent_bump_rate))) {
        throw ValidationError(who + "rent bump rate must exceed -100%");
    }
    if (!(ti_allowance_per_area >= 0.0 && lc_rate_years_1_5 >= 0.0 && lc_rate_years_6_plus >= 0.0) ||
        !std::isfinite(ti_allowance_per_area + lc_rate_years_1_5 + lc_rate_years_6_plus)) {
        throw ValidationError(who + "leasing cost inputs must be non-negative");
    }
    if (new_lease_term_years < 1) {
        throw ValidationError(who + "new lease term must be at least one year");
    }
}

void TenantSet::add(const Tenant& tenant) {
    tenants_.push_back(tenant);
}

void TenantSet::add(Tenant&& tenant) {
    tenants_.push_back(std::move(tenant));
}

const Tenant& TenantSet::get(size_t index) const {
    if (index >= tenants_.size()) {
        throw std::out_of_range("Tenant index out of range");
    }
    return tenants_[index];
}

double TenantSet::total_area() const {
    double total = 0.0;
    for (const auto& t : tenants_) {
        total += t.area;
    }
    return total;
}

void TenantSet::validate(double building_area) const {
    if (tenants_.empty()) {
        throw ValidationError("Rent roll has no tenants");
    }
    std::set<std::string> seen;
    for (const auto& t : tenants_) {
        t.validate();
        if (!seen.insert(t.id).second) {
            throw ValidationError("Duplicate tenant id: " + t.id);
        }
    }
    double total = total_area();
    if (std::fabs(total - building_area) > 1e-6 * std::max(1.0, building_area)) {
        throw ValidationError("Tenant areas sum to " + std::to_string(total) +
                              " but building area is " + std::to_string(building_area));
    }
}

TenantSet TenantSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ConfigParseError("Cannot open rent roll: " + filepath);
    }
    return load_from_csv(file);
}

TenantSet TenantSet::load_from_csv(std::istream& is) {
    TenantSet ts;
    io::CsvReader reader(is);
    if (!reader.read_header()) {
        throw ConfigParseError("Rent roll CSV is empty");
    }

    const size_t c_id = reader.column("id");
    const size_t c_area = reader.column("area");
    const size_t c_in_place = reader.column("in_place_rent");
    const size_t c_market = reader.column("market_rent");
    const size_t c_end = reader.column("lease_end_month");
    const size_t c_flag = reader.column("rollover_costs");

    auto optional_cell = [&](const std::vector<std::string>& row, const char* name) -> const std::string* {
        if (!reader.has_column(name)) {
            return nullptr;
        }
        size_t idx = reader.column(name);
        if (idx >= row.size() || row[idx].empty()) {
            return nullptr;
        }
        return &row[idx];
    };

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        const size_t line = reader.line_number();
        if (row.size() < reader.header().size()) {
            throw ConfigParseError("Rent roll row at line " + std::to_string(line) +
                                   " has " + std::to_string(row.size()) + " cells, expected " +
                                   std::to_string(reader.header().size()));
        }

        Tenant t;
        t.id = row[c_id];
        t.area = io::parse_double(row[c_area], "area", line);
        t.in_place_rent = io::parse_double(row[c_in_place], "in_place_rent", line);
        t.market_rent = io::parse_double(row[c_market], "market_rent", line);
        t.lease_end_month = io::parse_int(row[c_end], "lease_end_month", line);
        t.rollover_costs = io::parse_bool(row[c_flag], "rollover_costs", line);

        if (auto* c = optional_cell(row, "lease_start_month")) {
            t.lease_start_month = io::parse_int(*c, "lease_start_month", line);
        }
        if (auto* c = optional_cell(row, "ti_buildout_months")) {
            t.ti_buildout_months = io::parse_int(*c, "ti_buildout_months", line);
        }
        if (auto* c = optional_cell(row, "free_rent_months")) {
            t.free_rent_months = io::parse_int(*c, "free_rent_months", line);
        }
        if (auto* c = optional_cell(row, "rent_bump_rate")) {
            t.rent_bump_rate = io::parse_double(*c, "rent_bump_rate", line);
        }
        if (auto* c = optional_cell(row, "ti_allowance_per_area")) {
            t.ti_allowance_per_area = io::parse_double(*c, "ti_allowance_per_area", line);
        }
        if (auto* c = optional_cell(row, "lc_rate_years_1_5")) {
            t.lc_rate_years_1_5 = io::parse_double(*c, "lc_rate_years_1_5", line);
        }
        if (auto* c = optional_cell(row, "lc_rate_years_6_plus")) {
            t.lc_rate_years_6_plus = io::parse_double(*c, "lc_rate_years_6_plus", line);
        }
        if (auto* c = optional_cell(row, "new_lease_term_years")) {
            t.new_lease_term_years = io::parse_int(*c, "new_lease_term_years", line);
        }

        ts.add(std::move(t));
    }

    return ts;
}

} // namespace proforma
