#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>
#include "errors.hpp"
#include "exit_valuation.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;

TEST_CASE("Exit value capitalises forward NOI plus the reserve add-back", "[exit]") {
    std::vector<double> noi(37, 10.0);
    std::vector<double> reserve(37, 1.0);
    // Only periods 25..36 may count
    noi[24] = 1000.0;

    ExitValuation exit = value_exit(noi, reserve, 24, 0.05, 0.01);

    REQUIRE(exit.exit_period == 24);
    REQUIRE_THAT(exit.forward_capital_reserve, WithinRel(12.0, 1e-12));
    REQUIRE_THAT(exit.forward_noi, WithinRel(132.0, 1e-12));
    REQUIRE_THAT(exit.gross_value, WithinRel(2640.0, 1e-12));
    REQUIRE_THAT(exit.sales_costs, WithinRel(26.4, 1e-12));
    REQUIRE_THAT(exit.net_proceeds, WithinRel(2613.6, 1e-12));
}

TEST_CASE("Exit valuation failure modes", "[exit]") {
    std::vector<double> noi(37, 10.0);
    std::vector<double> reserve(37, 1.0);

    REQUIRE_THROWS_AS(value_exit(noi, reserve, 24, 0.0, 0.01), DivideByZeroError);
    REQUIRE_THROWS_AS(value_exit(noi, reserve, 24, -0.05, 0.01), DivideByZeroError);
    REQUIRE_THROWS_AS(value_exit(noi, reserve, 25, 0.05, 0.01), std::out_of_range);
    REQUIRE_THROWS_AS(value_exit(noi, std::vector<double>(30, 1.0), 24, 0.05, 0.01), std::out_of_range);
}
