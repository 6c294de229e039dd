#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "debt_schedule.hpp"
#include "errors.hpp"

using namespace proforma;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

std::vector<Date> benchmark_dates(int months) {
    return generate_monthly_dates(Date(2026, 3, 31), months);
}

Loan make_fixed_loan(double principal, double rate, int io_months) {
    Loan loan;
    loan.id = "senior";
    loan.principal = principal;
    loan.rate_mode = RateMode::Fixed;
    loan.fixed_rate = rate;
    loan.io_months = io_months;
    loan.amortization_months = 360;
    return loan;
}

RateCurve make_flat_curve(double rate) {
    RateCurve curve;
    curve.add(Date(2026, 3, 31), rate);
    curve.add(Date(2040, 3, 31), rate);
    return curve;
}

} // anonymous namespace

// ============================================================================
// Fixed-rate tranches
// ============================================================================

TEST_CASE("Interest-only loan on actual/365", "[debt]") {
    auto dates = benchmark_dates(120);
    Loan loan = make_fixed_loan(16937.18, 0.0525, 120);
    TrancheSchedule s = schedule_tranche(loan, dates, RateCurve(), 42000.0);

    REQUIRE(s.periods.size() == 121);
    REQUIRE(s.principal == 16937.18);

    const DebtPeriod& p0 = s.periods[0];
    REQUIRE(p0.draws == 16937.18);
    REQUIRE(p0.interest == 0.0);
    REQUIRE(p0.ending_balance == 16937.18);

    // April has 30 days
    REQUIRE_THAT(s.periods[1].interest, WithinRel(16937.18 * 0.0525 * 30.0 / 365.0, 1e-12));
    REQUIRE_THAT(s.periods[1].interest, WithinAbs(73.085, 1e-3));
    // May has 31
    REQUIRE_THAT(s.periods[2].interest, WithinRel(16937.18 * 0.0525 * 31.0 / 365.0, 1e-12));

    for (const auto& p : s.periods) {
        REQUIRE(p.scheduled_amortization == 0.0);
        REQUIRE(p.ending_balance == 16937.18);
    }
}

TEST_CASE("Amortization after the interest-only window", "[debt]") {
    auto dates = benchmark_dates(36);
    Loan loan = make_fixed_loan(1000.0, 0.06, 12);
    loan.day_count = DayCount::Monthly;
    loan.amortization_months = 120;
    TrancheSchedule s = schedule_tranche(loan, dates, RateCurve(), 2000.0);

    REQUIRE(s.periods[12].scheduled_amortization == 0.0);

    const double payment = level_payment(0.005, 120, 1000.0);
    REQUIRE_THAT(s.periods[13].interest, WithinRel(5.0, 1e-12));
    REQUIRE_THAT(s.periods[13].scheduled_amortization, WithinRel(payment - 5.0, 1e-10));
    REQUIRE_THAT(s.periods[13].debt_service, WithinRel(payment, 1e-10));

    // Level payment on the remaining term keeps debt service flat
    REQUIRE_THAT(s.periods[30].debt_service, WithinRel(payment, 1e-9));

    for (size_t t = 1; t < s.periods.size(); ++t) {
        const DebtPeriod& p = s.periods[t];
        REQUIRE_THAT(p.debt_service, WithinAbs(p.interest + p.principal_paydown, 1e-12));
        REQUIRE_THAT(p.ending_balance,
                     WithinAbs(p.beginning_balance + p.draws + p.prepayment - p.scheduled_amortization, 1e-9));
        REQUIRE(p.beginning_balance == s.periods[t - 1].ending_balance);
    }
}

TEST_CASE("Amortization term shorter than the hold balloons to zero", "[debt]") {
    auto dates = benchmark_dates(24);
    Loan loan = make_fixed_loan(600.0, 0.05, 0);
    loan.amortization_months = 12;
    loan.day_count = DayCount::Monthly;
    TrancheSchedule s = schedule_tranche(loan, dates, RateCurve(), 1000.0);

    REQUIRE_THAT(s.periods[12].ending_balance, WithinAbs(0.0, 1e-9));
    REQUIRE(s.periods[24].ending_balance == 0.0);
    REQUIRE_THAT(s.periods[13].debt_service, WithinAbs(0.0, 1e-9));
}

TEST_CASE("Loan-to-cost sizing, fees and draws", "[debt]") {
    auto dates = benchmark_dates(24);
    Loan loan = make_fixed_loan(0.0, 0.05, 24);
    loan.ltc = 0.5;
    loan.origination_fee_rate = 0.01;
    loan.closing_cost_rate = 0.005;
    loan.day_count = DayCount::Monthly;

    SECTION("Full draw at closing") {
        TrancheSchedule s = schedule_tranche(loan, dates, RateCurve(), 2000.0);
        REQUIRE(s.principal == 1000.0);
        REQUIRE_THAT(s.periods[0].fees, WithinRel(15.0, 1e-12));
        REQUIRE(s.periods[1].fees == 0.0);
    }

    SECTION("Scheduled draws accrue interest on half the draw") {
        loan.draws = {{3, 400.0}, {6, 600.0}};
        TrancheSchedule s = schedule_tranche(loan, dates, RateCurve(), 2000.0);
        REQUIRE(s.periods[0].draws == 0.0);
        REQUIRE(s.periods[0].fees == 0.0);
        REQUIRE_THAT(s.periods[3].fees, WithinRel(15.0, 1e-12));
        REQUIRE_THAT(s.periods[3].interest, WithinRel(200.0 * 0.05 / 12.0, 1e-12));
        REQUIRE_THAT(s.periods[4].interest, WithinRel(400.0 * 0.05 / 12.0, 1e-12));
        REQUIRE_THAT(s.periods[6].ending_balance, WithinRel(1000.0, 1e-12));
    }
}

TEST_CASE("Prepayments reduce the balance and count as debt service", "[debt]") {
    auto dates = benchmark_dates(24);
    Loan loan = make_fixed_loan(1000.0, 0.05, 24);
    loan.day_count = DayCount::Monthly;
    loan.prepayments = {{12, 250.0}};
    TrancheSchedule s = schedule_tranche(loan, dates, RateCurve(), 2000.0);

    const DebtPeriod& p = s.periods[12];
    REQUIRE(p.prepayment == -250.0);
    REQUIRE(p.principal_paydown == 250.0);
    REQUIRE_THAT(p.debt_service, WithinRel(p.interest + 250.0, 1e-12));
    REQUIRE(p.ending_balance == 750.0);

    SECTION("Overpaying the balance is an invariant violation") {
        loan.prepayments = {{12, 1500.0}};
        REQUIRE_THROWS_AS(schedule_tranche(loan, dates, RateCurve(), 2000.0), InvariantViolation);
    }
}

// ============================================================================
// Floating-rate tranches
// ============================================================================

TEST_CASE("Floating rate is index plus spread", "[debt]") {
    auto dates = benchmark_dates(24);
    Loan loan = make_fixed_loan(1000.0, 0.0, 24);
    loan.rate_mode = RateMode::Floating;
    loan.spread = 0.02;
    loan.day_count = DayCount::Monthly;

    SECTION("Flat curve") {
        TrancheSchedule s = schedule_tranche(loan, dates, make_flat_curve(0.04), 2000.0);
        REQUIRE_THAT(s.periods[1].annual_rate, WithinRel(0.06, 1e-12));
        REQUIRE_THAT(s.periods[1].interest, WithinRel(5.0, 1e-12));
    }

    SECTION("Stepped curve") {
        RateCurve curve;
        curve.add(Date(2026, 3, 31), 0.04);
        curve.add(Date(2027, 3, 31), 0.03);
        curve.add(Date(2030, 3, 31), 0.03);
        TrancheSchedule s = schedule_tranche(loan, dates, curve, 2000.0);
        REQUIRE_THAT(s.periods[11].annual_rate, WithinRel(0.06, 1e-12));
        REQUIRE_THAT(s.periods[12].annual_rate, WithinRel(0.05, 1e-12));
    }

    SECTION("Missing curve") {
        REQUIRE_THROWS_AS(schedule_tranche(loan, dates, RateCurve(), 2000.0), ValidationError);
    }

    SECTION("Curve ending before the hold") {
        RateCurve curve;
        curve.add(Date(2026, 3, 31), 0.04);
        curve.add(Date(2027, 3, 31), 0.04);
        REQUIRE_THROWS_AS(schedule_tranche(loan, dates, curve, 2000.0), RateCurveRangeError);
    }
}

// ============================================================================
// Aggregation
// ============================================================================

TEST_CASE("Debt schedule sums tranches", "[debt]") {
    auto dates = benchmark_dates(24);
    Loan senior = make_fixed_loan(1000.0, 0.06, 24);
    senior.day_count = DayCount::Monthly;
    Loan mezz = make_fixed_loan(500.0, 0.12, 24);
    mezz.id = "mezz";
    mezz.day_count = DayCount::Monthly;

    DebtSchedule debt = build_debt_schedule({senior, mezz}, dates, RateCurve(), 2000.0);

    REQUIRE(debt.tranches().size() == 2);
    REQUIRE(debt.totals().size() == 25);
    REQUIRE(debt.total_principal() == 1500.0);
    REQUIRE_THAT(debt.at(1).interest, WithinRel(5.0 + 5.0, 1e-12));
    REQUIRE_THAT(debt.at(1).annual_rate, WithinRel((1000.0 * 0.06 + 500.0 * 0.12) / 1500.0, 1e-12));
    REQUIRE(debt.payoff(24) == 1500.0);

    REQUIRE_THROWS_AS(debt.at(25), std::out_of_range);
    REQUIRE_THROWS_AS(debt.at(-1), std::out_of_range);
}

TEST_CASE("No loans gives an empty schedule", "[debt]") {
    DebtSchedule debt = build_debt_schedule({}, benchmark_dates(12), RateCurve(), 1000.0);
    REQUIRE(debt.empty());
    REQUIRE(debt.total_principal() == 0.0);
    REQUIRE(debt.at(12).debt_service == 0.0);
}
