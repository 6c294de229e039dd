#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sstream>
#include <string>
#include "errors.hpp"
#include "rate_curve.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;

TEST_CASE("Rate curve is a step function over its points", "[rate_curve]") {
    RateCurve curve;
    curve.add(Date(2026, 3, 31), 0.043);
    curve.add(Date(2027, 3, 31), 0.0395);
    curve.add(Date(2028, 3, 31), 0.037);

    REQUIRE(curve.size() == 3);
    REQUIRE(curve.get_rate(Date(2026, 3, 31)) == 0.043);
    REQUIRE(curve.get_rate(Date(2026, 12, 31)) == 0.043);
    REQUIRE(curve.get_rate(Date(2027, 3, 31)) == 0.0395);
    REQUIRE(curve.get_rate(Date(2028, 3, 31)) == 0.037);

    SECTION("No extrapolation outside the curve") {
        REQUIRE_THROWS_AS(curve.get_rate(Date(2026, 3, 30)), RateCurveRangeError);
        REQUIRE_THROWS_AS(curve.get_rate(Date(2028, 4, 1)), RateCurveRangeError);
    }

    SECTION("Dates must increase") {
        REQUIRE_THROWS_AS(curve.add(Date(2028, 3, 31), 0.04), ValidationError);
        REQUIRE_THROWS_AS(curve.add(Date(2027, 1, 1), 0.04), ValidationError);
    }
}

TEST_CASE("Empty rate curve has no rates", "[rate_curve]") {
    RateCurve curve;
    REQUIRE(curve.empty());
    REQUIRE_THROWS_AS(curve.get_rate(Date(2026, 1, 1)), RateCurveRangeError);
}

TEST_CASE("Rate curve loads from CSV", "[rate_curve][csv]") {
    SECTION("Inline CSV") {
        std::istringstream csv("date,rate\n2026-03-31,0.05\n2026-09-30,0.045\n");
        RateCurve curve = RateCurve::load_from_csv(csv);
        REQUIRE(curve.size() == 2);
        REQUIRE_THAT(curve.get_rate(Date(2026, 9, 30)),
                     WithinRel(0.045, 1e-12));
        REQUIRE_THAT(curve.get_rate(Date(2026, 6, 30)), WithinRel(0.05, 1e-12));
    }

    SECTION("Bad date") {
        std::istringstream csv("date,rate\n2026-13-31,0.05\n");
        REQUIRE_THROWS(RateCurve::load_from_csv(csv));
    }

    SECTION("Bundled SOFR curve spans the benchmark hold") {
        RateCurve curve = RateCurve::load_from_csv(std::string(PROFORMA_DATA_DIR) + "/sofr_curve.csv");
        REQUIRE(curve.size() == 11);
        REQUIRE(curve.points().front().date == Date(2026, 3, 31));
        REQUIRE(curve.points().back().date == Date(2036, 3, 31));
        REQUIRE_THAT(curve.get_rate(Date(2030, 6, 30)), WithinRel(0.035, 1e-12));
    }
}
