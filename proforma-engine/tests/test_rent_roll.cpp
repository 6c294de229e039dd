#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "errors.hpp"
#include "escalation.hpp"
#include "rent_roll.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

ScenarioParameters make_scenario(int hold) {
    ScenarioParameters s;
    s.acquisition_date = Date(2026, 3, 31);
    s.hold_months = hold;
    s.building_area = 1200.0;
    s.purchase_price = 5000.0;
    return s;
}

// 1,200 area at 100 in place, 120 market; rolls after month 12
Tenant make_rollover_tenant() {
    Tenant t;
    t.id = "Suite 100";
    t.area = 1200.0;
    t.in_place_rent = 100.0;
    t.market_rent = 120.0;
    t.lease_end_month = 12;
    t.rollover_costs = true;
    t.ti_buildout_months = 2;
    t.free_rent_months = 3;
    t.ti_allowance_per_area = 10.0;
    t.lc_rate_years_1_5 = 0.06;
    t.lc_rate_years_6_plus = 0.03;
    t.new_lease_term_years = 5;
    return t;
}

} // anonymous namespace

// ============================================================================
// Single tenant
// ============================================================================

TEST_CASE("Tenant projection through rollover", "[rent_roll]") {
    Tenant t = make_rollover_tenant();
    auto esc = rent_escalation(36, 0.0);
    TenantProjection p = project_tenant(t, esc, 1000.0);

    REQUIRE(p.revenue.size() == 37);
    REQUIRE(p.revenue[0] == 0.0);

    SECTION("In-place rent through the lease end") {
        for (int m = 1; m <= 12; ++m) {
            REQUIRE_THAT(p.revenue[m], WithinRel(10.0, 1e-12));
            REQUIRE(p.free_rent[m] == 0.0);
        }
    }

    SECTION("Buildout gap earns nothing") {
        REQUIRE(p.revenue[13] == 0.0);
        REQUIRE(p.revenue[14] == 0.0);
    }

    SECTION("Market rent with free rent offset") {
        for (int m = 15; m <= 17; ++m) {
            REQUIRE_THAT(p.revenue[m], WithinRel(12.0, 1e-12));
            REQUIRE_THAT(p.free_rent[m], WithinRel(-12.0, 1e-12));
        }
        REQUIRE_THAT(p.revenue[18], WithinRel(12.0, 1e-12));
        REQUIRE(p.free_rent[18] == 0.0);
    }
}

TEST_CASE("Tenant without the rollover flag goes straight to market", "[rent_roll]") {
    Tenant t = make_rollover_tenant();
    t.rollover_costs = false;
    auto esc = rent_escalation(24, 0.0);
    TenantProjection p = project_tenant(t, esc, 1000.0);

    REQUIRE_THAT(p.revenue[13], WithinRel(12.0, 1e-12));
    for (double f : p.free_rent) {
        REQUIRE(f == 0.0);
    }
}

TEST_CASE("Market rent uses the escalation factor of the period", "[rent_roll]") {
    Tenant t = make_rollover_tenant();
    auto esc = rent_escalation(36, 0.03);
    TenantProjection p = project_tenant(t, esc, 1000.0);

    REQUIRE_THAT(p.revenue[1], WithinRel(10.0 * esc[1], 1e-12));
    REQUIRE_THAT(p.revenue[20], WithinRel(12.0 * esc[20], 1e-12));
}

TEST_CASE("Future lease start and tenant-specific bumps", "[rent_roll]") {
    Tenant t = make_rollover_tenant();
    auto esc = rent_escalation(24, 0.0);

    SECTION("No revenue before the lease starts") {
        t.lease_start_month = 4;
        TenantProjection p = project_tenant(t, esc, 1000.0);
        REQUIRE(p.revenue[3] == 0.0);
        REQUIRE_THAT(p.revenue[4], WithinRel(10.0, 1e-12));
    }

    SECTION("In-place rent follows the tenant bump, market rent the scenario") {
        t.rent_bump_rate = 0.12;
        TenantProjection p = project_tenant(t, esc, 1000.0);
        REQUIRE_THAT(p.revenue[1], WithinRel(10.0 * 1.01, 1e-12));
        REQUIRE_THAT(p.revenue[2], WithinRel(10.0 * 1.01 * 1.01, 1e-12));
        REQUIRE_THAT(p.revenue[15], WithinRel(12.0, 1e-12));
    }
}

TEST_CASE("Leasing commission by lease year", "[rent_roll]") {
    Tenant t = make_rollover_tenant();

    SECTION("Free rent reduces year one") {
        // Year 1: 144 x 9/12 x 6%; years 2-5: 144 x 6% each
        REQUIRE_THAT(leasing_commission(t, 144.0, 0.0), WithinRel(6.48 + 4 * 8.64, 1e-12));
    }

    SECTION("Split rates across a ten-year lease") {
        t.free_rent_months = 0;
        t.new_lease_term_years = 10;
        REQUIRE_THAT(leasing_commission(t, 100.0, 0.0), WithinRel(5 * 6.0 + 5 * 3.0, 1e-12));
    }

    SECTION("Rent grows each lease year") {
        t.free_rent_months = 0;
        t.new_lease_term_years = 2;
        REQUIRE_THAT(leasing_commission(t, 100.0, 0.10), WithinRel(6.0 + 6.6, 1e-12));
    }
}

// ============================================================================
// Rent roll totals
// ============================================================================

TEST_CASE("Rent roll totals, leasing costs and ancillary income", "[rent_roll]") {
    ScenarioParameters s = make_scenario(24);
    s.ancillary.parking_stalls = 10;
    s.ancillary.parking_rate_per_stall = 100.0;
    s.ancillary.storage_units = 4;
    s.ancillary.storage_rate_per_unit = 50.0;

    TenantSet tenants;
    tenants.add(make_rollover_tenant());
    auto esc = rent_escalation(s.projection_periods(), 0.0);

    RentRollProjection roll = project_rent_roll(tenants, s, esc);

    REQUIRE(roll.num_periods() == 37);
    REQUIRE(roll.tenants.size() == 1);

    SECTION("Rental revenue nets free rent") {
        REQUIRE_THAT(roll.rental_revenue[12], WithinRel(10.0, 1e-12));
        REQUIRE_THAT(roll.rental_revenue[15], WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(roll.rental_revenue[18], WithinRel(12.0, 1e-12));
    }

    SECTION("TI and commission land in the rollover month") {
        const double ti = 1200.0 * 10.0 / 1000.0;
        const double lc = 6.48 + 4 * 8.64;
        REQUIRE_THAT(roll.leasing_costs[13], WithinRel(ti + lc, 1e-12));
        REQUIRE_THAT(roll.tenants[0].ti_cost[13], WithinRel(ti, 1e-12));
        double total = 0.0;
        for (double c : roll.leasing_costs) {
            total += c;
        }
        REQUIRE_THAT(total, WithinRel(ti + lc, 1e-12));
    }

    SECTION("Parking and storage from period 1") {
        REQUIRE(roll.parking_income[0] == 0.0);
        REQUIRE_THAT(roll.parking_income[1], WithinRel(1.0, 1e-12));
        REQUIRE_THAT(roll.storage_income[36], WithinRel(0.2, 1e-12));
    }
}

TEST_CASE("Rollover after the hold carries no leasing cost", "[rent_roll]") {
    ScenarioParameters s = make_scenario(12);
    Tenant t = make_rollover_tenant();
    t.lease_end_month = 18;
    TenantSet tenants;
    tenants.add(t);

    RentRollProjection roll = project_rent_roll(tenants, s, rent_escalation(s.projection_periods(), 0.0));
    for (double c : roll.leasing_costs) {
        REQUIRE(c == 0.0);
    }
    // Forward rows still see the rollover
    REQUIRE(roll.tenant_revenue[19] == 0.0);
    REQUIRE_THAT(roll.free_rent[21], WithinRel(-12.0, 1e-12));
}

TEST_CASE("Rent roll rejects a short escalation series", "[rent_roll]") {
    ScenarioParameters s = make_scenario(24);
    TenantSet tenants;
    tenants.add(make_rollover_tenant());
    REQUIRE_THROWS_AS(project_rent_roll(tenants, s, rent_escalation(24, 0.0)), InvariantViolation);
}
