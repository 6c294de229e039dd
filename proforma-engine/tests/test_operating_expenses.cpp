#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>
#include "errors.hpp"
#include "escalation.hpp"
#include "operating_expenses.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;

namespace {

ScenarioParameters make_scenario() {
    ScenarioParameters s;
    s.hold_months = 24;
    s.building_area = 1000.0;
    s.fixed_opex_per_area = 12.0;
    s.variable_opex_per_area = 6.0;
    s.capital_reserve_per_area = 2.4;
    s.property_tax.annual_base = 120.0;
    s.property_tax.growth = 0.10;
    s.ancillary.parking_expense_rate = 0.10;
    return s;
}

} // anonymous namespace

TEST_CASE("Expense lines from per-area rates", "[expenses]") {
    ScenarioParameters s = make_scenario();
    const int n = s.projection_periods();
    auto esc = expense_escalation(n, 0.0);
    auto tax = property_tax_steps(n, s.property_tax.growth);
    std::vector<double> parking(n + 1, 2.0);

    ExpenseProjection e = project_expenses(s, esc, tax, parking);
    REQUIRE(e.num_periods() == static_cast<size_t>(n + 1));

    SECTION("Period 0 is empty") {
        REQUIRE(e.fixed_opex[0] == 0.0);
        REQUIRE(e.property_tax[0] == 0.0);
        REQUIRE(e.parking_expense[0] == 0.0);
        REQUIRE(e.capital_reserve[0] == 0.0);
    }

    SECTION("Monthly amounts") {
        REQUIRE_THAT(e.fixed_opex[1], WithinRel(1.0, 1e-12));
        REQUIRE_THAT(e.variable_opex[1], WithinRel(0.5, 1e-12));
        REQUIRE_THAT(e.capital_reserve[1], WithinRel(0.2, 1e-12));
        REQUIRE_THAT(e.property_tax[1], WithinRel(10.0, 1e-12));
        REQUIRE_THAT(e.parking_expense[1], WithinRel(0.2, 1e-12));
    }

    SECTION("Tax steps annually") {
        REQUIRE_THAT(e.property_tax[12], WithinRel(10.0, 1e-12));
        REQUIRE_THAT(e.property_tax[13], WithinRel(11.0, 1e-12));
    }
}

TEST_CASE("Expenses escalate at the monthly root", "[expenses]") {
    ScenarioParameters s = make_scenario();
    const int n = s.projection_periods();
    auto esc = expense_escalation(n, 0.03);
    ExpenseProjection e = project_expenses(s, esc, property_tax_steps(n, 0.0), std::vector<double>(n + 1, 0.0));

    REQUIRE_THAT(e.fixed_opex[13] / e.fixed_opex[1], WithinRel(1.03, 1e-12));
}

TEST_CASE("Expense inputs must align", "[expenses]") {
    ScenarioParameters s = make_scenario();
    auto esc = expense_escalation(36, 0.0);
    auto tax = property_tax_steps(30, 0.0);
    REQUIRE_THROWS_AS(project_expenses(s, esc, tax, std::vector<double>(37, 0.0)), InvariantViolation);
}

TEST_CASE("Management fee with and without circular resolution", "[expenses]") {
    FeeBasis basis{100.0, -2.0, 0.05, 0.04, true};

    SECTION("Direct fee on effective revenue before the fee") {
        REQUIRE_THAT(management_fee(basis, false), WithinRel(0.04 * 93.0, 1e-12));
    }

    SECTION("Closed-form fixed point") {
        const double fee = management_fee(basis, true);
        REQUIRE_THAT(fee, WithinRel(0.04 * 93.0 / (1.0 - 0.04 * 0.95), 1e-12));
        // The fee equals m x effective revenue including its own recovery
        const double effective = (100.0 + fee) * 0.95 - 2.0;
        REQUIRE_THAT(fee, WithinRel(0.04 * effective, 1e-12));
    }

    SECTION("No fixed point to solve when the fee is not recovered") {
        basis.fee_reimbursed = false;
        REQUIRE_THAT(management_fee(basis, true), WithinRel(0.04 * 93.0, 1e-12));
    }

    SECTION("Degenerate fee rate") {
        FeeBasis bad{100.0, 0.0, 0.0, 1.0, true};
        REQUIRE_THROWS_AS(management_fee(bad, true), DivideByZeroError);
    }
}
