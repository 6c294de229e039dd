#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include "tenant.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;

namespace {

Tenant make_tenant(const std::string& id, double area, int lease_end) {
    Tenant t;
    t.id = id;
    t.area = area;
    t.in_place_rent = 200.0;
    t.market_rent = 300.0;
    t.lease_end_month = lease_end;
    return t;
}

} // anonymous namespace

TEST_CASE("CsvReader handles headers, quotes and blank lines", "[csv]") {
    std::istringstream csv(
        "id, area ,note\r\n"
        "\n"
        "A,100,\"Suite 1, ground floor\"\r\n"
        "   \n"
        "B,200,\"He said \"\"hi\"\"\"\n");

    io::CsvReader reader(csv);
    REQUIRE(reader.read_header());
    REQUIRE(reader.header().size() == 3);
    REQUIRE(reader.has_column("area"));
    REQUIRE(reader.column("note") == 2);
    REQUIRE_THROWS_AS(reader.column("missing"), ConfigParseError);

    auto row = reader.read_row();
    REQUIRE(row.size() == 3);
    REQUIRE(row[0] == "A");
    REQUIRE(row[2] == "Suite 1, ground floor");
    REQUIRE(reader.line_number() == 3);

    row = reader.read_row();
    REQUIRE(row[2] == "He said \"hi\"");
    REQUIRE(reader.read_row().empty());
}

TEST_CASE("CSV cell conversions name the column and line", "[csv]") {
    REQUIRE(io::parse_double("1.5", "rate", 2) == 1.5);
    REQUIRE(io::parse_int("42", "months", 2) == 42);
    REQUIRE(io::parse_bool("TRUE", "flag", 2));
    REQUIRE(io::parse_bool("yes", "flag", 2));
    REQUIRE_FALSE(io::parse_bool("0", "flag", 2));
    REQUIRE_FALSE(io::parse_bool("", "flag", 2));

    try {
        io::parse_double("abc", "market_rent", 7);
        FAIL("Expected ConfigParseError");
    } catch (const ConfigParseError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("market_rent") != std::string::npos);
        REQUIRE(msg.find("7") != std::string::npos);
    }
    REQUIRE_THROWS_AS(io::parse_int("12x", "months", 1), ConfigParseError);
    REQUIRE_THROWS_AS(io::parse_bool("maybe", "flag", 1), ConfigParseError);
}

TEST_CASE("Tenant rollover months", "[tenant]") {
    Tenant t = make_tenant("A", 1000, 50);
    t.ti_buildout_months = 6;

    SECTION("Without the rollover flag market rent starts right after the lease") {
        REQUIRE(t.rollover_month() == 51);
        REQUIRE(t.market_start_month() == 51);
    }

    SECTION("With the flag the buildout gap delays market rent") {
        t.rollover_costs = true;
        REQUIRE(t.rollover_month() == 51);
        REQUIRE(t.market_start_month() == 57);
    }
}

TEST_CASE("Tenant validation", "[tenant]") {
    Tenant t = make_tenant("A", 1000, 50);
    REQUIRE_NOTHROW(t.validate());

    SECTION("Empty id") {
        t.id = "";
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
    SECTION("Non-positive area") {
        t.area = 0.0;
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
    SECTION("Lease ends before it starts") {
        t.lease_start_month = 10;
        t.lease_end_month = 5;
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
    SECTION("Negative free rent") {
        t.free_rent_months = -1;
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
    SECTION("NaN rent") {
        t.in_place_rent = std::nan("");
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
    SECTION("Infinite market rent") {
        t.market_rent = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
    SECTION("NaN area") {
        t.area = std::nan("");
        REQUIRE_THROWS_AS(t.validate(), ValidationError);
    }
}

TEST_CASE("CSV numbers must be finite", "[tenant][csv]") {
    REQUIRE_THROWS_AS(io::parse_double("nan", "in_place_rent", 3), ConfigParseError);
    REQUIRE_THROWS_AS(io::parse_double("inf", "market_rent", 4), ConfigParseError);
    REQUIRE_THROWS_AS(io::parse_double("-INF", "area", 5), ConfigParseError);
}

TEST_CASE("TenantSet validates the building area", "[tenant]") {
    TenantSet set;
    set.add(make_tenant("A", 600, 24));
    set.add(make_tenant("B", 400, 36));

    REQUIRE(set.size() == 2);
    REQUIRE_THAT(set.total_area(), WithinRel(1000.0, 1e-12));
    REQUIRE_NOTHROW(set.validate(1000.0));
    REQUIRE_THROWS_AS(set.validate(1200.0), ValidationError);
    REQUIRE_THROWS_AS(set.get(5), std::out_of_range);

    SECTION("Duplicate ids are rejected") {
        set.add(make_tenant("A", 100, 12));
        REQUIRE_THROWS_AS(set.validate(1100.0), ValidationError);
    }

    SECTION("An empty rent roll is rejected") {
        TenantSet empty;
        REQUIRE_THROWS_AS(empty.validate(1000.0), ValidationError);
    }
}

TEST_CASE("TenantSet loads a rent roll CSV", "[tenant][csv]") {
    SECTION("Required and optional columns") {
        std::istringstream csv(
            "id,area,in_place_rent,market_rent,lease_end_month,rollover_costs,ti_buildout_months,free_rent_months,rent_bump_rate\n"
            "Peter Millar,2300,201.45,300,83,false,,,\n"
            "J McLaughlin,1868,200.47,300,50,true,6,10,0.03\n");

        TenantSet set = TenantSet::load_from_csv(csv);
        REQUIRE(set.size() == 2);

        const Tenant& pm = set.get(0);
        REQUIRE(pm.id == "Peter Millar");
        REQUIRE(pm.area == 2300.0);
        REQUIRE(pm.lease_end_month == 83);
        REQUIRE_FALSE(pm.rollover_costs);
        REQUIRE(pm.ti_buildout_months == 0);
        REQUIRE_FALSE(pm.rent_bump_rate.has_value());

        const Tenant& jm = set.get(1);
        REQUIRE(jm.rollover_costs);
        REQUIRE(jm.ti_buildout_months == 6);
        REQUIRE(jm.free_rent_months == 10);
        REQUIRE(jm.rent_bump_rate.has_value());
        REQUIRE_THAT(*jm.rent_bump_rate, WithinRel(0.03, 1e-12));
    }

    SECTION("Missing required column") {
        std::istringstream csv("id,area,in_place_rent,market_rent,rollover_costs\nA,1,1,1,true\n");
        REQUIRE_THROWS_AS(TenantSet::load_from_csv(csv), ConfigParseError);
    }

    SECTION("Bad cell") {
        std::istringstream csv(
            "id,area,in_place_rent,market_rent,lease_end_month,rollover_costs\n"
            "A,lots,1,1,12,true\n");
        REQUIRE_THROWS_AS(TenantSet::load_from_csv(csv), ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(TenantSet::load_from_csv("/nonexistent/rent_roll.csv"), ConfigParseError);
    }

    SECTION("Bundled benchmark rent roll") {
        TenantSet set = TenantSet::load_from_csv(std::string(PROFORMA_DATA_DIR) + "/benchmark_rent_roll.csv");
        REQUIRE(set.size() == 3);
        REQUIRE_NOTHROW(set.validate(10118.0));
    }
}
