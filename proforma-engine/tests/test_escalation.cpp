#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "escalation.hpp"
#include "errors.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

TEST_CASE("Rent escalation compounds monthly at r/12", "[escalation]") {
    auto f = rent_escalation(24, 0.025);

    REQUIRE(f.size() == 25);
    REQUIRE(f[0] == 1.0);
    REQUIRE_THAT(f[1], WithinRel(1.0 + 0.025 / 12.0, 1e-12));
    REQUIRE_THAT(f[12], WithinRel(std::pow(1.0 + 0.025 / 12.0, 12), 1e-12));

    // Monthly compounding overshoots the nominal annual rate
    REQUIRE(f[12] > 1.025);
}

TEST_CASE("Expense escalation reaches the annual rate after 12 periods", "[escalation]") {
    auto f = expense_escalation(24, 0.025);

    REQUIRE(f.size() == 25);
    REQUIRE(f[0] == 1.0);
    REQUIRE_THAT(f[12], WithinRel(1.025, 1e-12));
    REQUIRE_THAT(f[24], WithinRel(1.025 * 1.025, 1e-12));
}

TEST_CASE("Rent and expense escalation diverge after the first year", "[escalation]") {
    auto rent = rent_escalation(12, 0.03);
    auto expense = expense_escalation(12, 0.03);
    REQUIRE(rent[12] - expense[12] > 1e-4);
}

TEST_CASE("Post-stabilisation rent growth replaces the base rate", "[escalation]") {
    auto f = rent_escalation(24, 0.06, 0.02, 12);

    REQUIRE_THAT(f[12], WithinRel(std::pow(1.0 + 0.06 / 12.0, 12), 1e-12));
    REQUIRE_THAT(f[13] / f[12], WithinRel(1.0 + 0.02 / 12.0, 1e-12));
    REQUIRE_THAT(f[24] / f[12], WithinRel(std::pow(1.0 + 0.02 / 12.0, 12), 1e-12));
}

TEST_CASE("Zero growth gives flat factors", "[escalation]") {
    auto rent = rent_escalation(36, 0.0);
    auto expense = expense_escalation(36, 0.0);
    for (size_t t = 0; t < rent.size(); ++t) {
        REQUIRE(rent[t] == 1.0);
        REQUIRE(expense[t] == 1.0);
    }
}

TEST_CASE("Property tax steps once per year from the start month", "[escalation]") {
    SECTION("Default start") {
        auto f = property_tax_steps(36, 0.02);
        REQUIRE(f.size() == 37);
        REQUIRE(f[0] == 0.0);
        REQUIRE(f[1] == 1.0);
        REQUIRE(f[12] == 1.0);
        REQUIRE_THAT(f[13], WithinRel(1.02, 1e-12));
        REQUIRE_THAT(f[24], WithinRel(1.02, 1e-12));
        REQUIRE_THAT(f[25], WithinRel(1.02 * 1.02, 1e-12));
    }

    SECTION("Deferred start is untaxed before the start month") {
        auto f = property_tax_steps(30, 0.05, 6);
        for (int t = 0; t < 6; ++t) {
            REQUIRE(f[t] == 0.0);
        }
        REQUIRE(f[6] == 1.0);
        REQUIRE(f[17] == 1.0);
        REQUIRE_THAT(f[18], WithinRel(1.05, 1e-12));
    }
}

TEST_CASE("Escalation rejects invalid inputs", "[escalation]") {
    REQUIRE_THROWS_AS(rent_escalation(-1, 0.02), ValidationError);
    REQUIRE_THROWS_AS(expense_escalation(12, -1.0), ValidationError);
    REQUIRE_THROWS_AS(rent_escalation(12, 0.02, -1.5, 6), ValidationError);
    REQUIRE_THROWS_AS(property_tax_steps(12, 0.02, -1), ValidationError);

    auto empty = rent_escalation(0, 0.02);
    REQUIRE(empty.size() == 1);
    REQUIRE_THAT(empty[0], WithinAbs(1.0, 0.0));
}
