#include "debt_schedule.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace proforma {

namespace {

constexpr double kBalanceEpsilon = 1e-9;

std::vector<double> spread_by_period(const std::vector<ScheduledAmount>& amounts, size_t n) {
    std::vector<double> out(n, 0.0);
    for (const auto& a : amounts) {
        if (a.period < 0 || static_cast<size_t>(a.period) >= n) {
            throw std::out_of_range("Scheduled amount at period " + std::to_string(a.period) +
                                    " beyond debt schedule");
        }
        out[a.period] += a.amount;
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Tranche schedule
// ============================================================================

TrancheSchedule schedule_tranche(
    const Loan& loan,
    const std::vector<Date>& dates,
    const RateCurve& curve,
    double acquisition_cost)
{
    if (dates.empty()) {
        throw ValidationError("Debt schedule needs at least one period date");
    }
    if (loan.rate_mode == RateMode::Floating && curve.empty()) {
        throw ValidationError("Loan '" + loan.id + "' is floating but no rate curve was supplied");
    }

    const size_t n = dates.size();
    TrancheSchedule schedule;
    schedule.loan_id = loan.id;
    schedule.principal = loan.resolved_principal(acquisition_cost);

    std::vector<double> draws;
    if (loan.draws.empty()) {
        draws.assign(n, 0.0);
        draws[0] = schedule.principal;
    } else {
        draws = spread_by_period(loan.draws, n);
    }
    const std::vector<double> prepayments = spread_by_period(loan.prepayments, n);

    // Fees land in the first period with a draw
    int fee_period = -1;
    for (size_t t = 0; t < n; ++t) {
        if (draws[t] > 0.0) {
            fee_period = static_cast<int>(t);
            break;
        }
    }
    const double fees = (loan.origination_fee_rate + loan.closing_cost_rate) * schedule.principal;

    schedule.periods.resize(n);
    double balance = 0.0;

    for (size_t t = 0; t < n; ++t) {
        DebtPeriod& p = schedule.periods[t];
        p.period = static_cast<int>(t);
        p.beginning_balance = balance;
        p.draws = draws[t];
        p.fees = (static_cast<int>(t) == fee_period) ? fees : 0.0;

        if (t > 0) {
            p.annual_rate = (loan.rate_mode == RateMode::Fixed)
                ? loan.fixed_rate
                : curve.get_rate(dates[t]) + loan.spread;

            const double average_balance = balance + p.draws / 2.0;
            if (loan.day_count == DayCount::Actual365) {
                const int32_t days = days_between(dates[t - 1], dates[t]);
                p.interest = average_balance * p.annual_rate * days / 365.0;
            } else {
                p.interest = average_balance * p.annual_rate / 12.0;
            }

            const int io_end = loan.io_months;
            if (static_cast<int>(t) > io_end && balance > 0.0) {
                const int remaining = loan.amortization_months - (static_cast<int>(t) - io_end - 1);
                const double payment = level_payment(p.annual_rate / 12.0, remaining, balance);
                p.scheduled_amortization = std::min(std::max(payment - p.interest, 0.0), balance);
                if (remaining <= 0) {
                    p.scheduled_amortization = balance;
                }
            }
        }

        p.prepayment = -prepayments[t];
        p.principal_paydown = p.scheduled_amortization - p.prepayment;
        p.debt_service = p.interest + p.principal_paydown;
        p.ending_balance = p.beginning_balance + p.draws + p.prepayment - p.scheduled_amortization;

        if (p.ending_balance < -kBalanceEpsilon) {
            throw InvariantViolation("Loan '" + loan.id + "' balance negative at period " +
                                     std::to_string(t) + ": " + std::to_string(p.ending_balance));
        }
        if (p.ending_balance < 0.0) {
            p.ending_balance = 0.0;
        }
        balance = p.ending_balance;
    }

    return schedule;
}

// ============================================================================
// Aggregate schedule
// ============================================================================

DebtSchedule::DebtSchedule(std::vector<TrancheSchedule> tranches, int num_periods)
    : tranches_(std::move(tranches))
{
    totals_.resize(static_cast<size_t>(std::max(num_periods, 0)));
    for (size_t t = 0; t < totals_.size(); ++t) {
        totals_[t].period = static_cast<int>(t);
    }

    for (const auto& tranche : tranches_) {
        if (tranche.periods.size() != totals_.size()) {
            throw InvariantViolation("Tranche '" + tranche.loan_id + "' has a mismatched period count");
        }
        for (size_t t = 0; t < totals_.size(); ++t) {
            const DebtPeriod& p = tranche.periods[t];
            DebtPeriod& sum = totals_[t];
            sum.beginning_balance += p.beginning_balance;
            sum.draws += p.draws;
            sum.interest += p.interest;
            sum.scheduled_amortization += p.scheduled_amortization;
            sum.prepayment += p.prepayment;
            sum.principal_paydown += p.principal_paydown;
            sum.debt_service += p.debt_service;
            sum.fees += p.fees;
            sum.ending_balance += p.ending_balance;
        }
    }

    // Balance-weighted rate for reporting
    for (size_t t = 0; t < totals_.size(); ++t) {
        double weight = 0.0;
        double weighted = 0.0;
        for (const auto& tranche : tranches_) {
            const DebtPeriod& p = tranche.periods[t];
            double w = p.beginning_balance + p.draws / 2.0;
            weight += w;
            weighted += w * p.annual_rate;
        }
        totals_[t].annual_rate = weight > 0.0 ? weighted / weight : 0.0;
    }
}

const DebtPeriod& DebtSchedule::at(int period) const {
    if (period < 0 || static_cast<size_t>(period) >= totals_.size()) {
        throw std::out_of_range("Debt schedule has no period " + std::to_string(period));
    }
    return totals_[period];
}

double DebtSchedule::total_principal() const {
    double total = 0.0;
    for (const auto& t : tranches_) {
        total += t.principal;
    }
    return total;
}

DebtSchedule build_debt_schedule(
    const std::vector<Loan>& loans,
    const std::vector<Date>& dates,
    const RateCurve& curve,
    double acquisition_cost)
{
    std::vector<TrancheSchedule> tranches;
    tranches.reserve(loans.size());
    for (const auto& loan : loans) {
        tranches.push_back(schedule_tranche(loan, dates, curve, acquisition_cost));
    }
    return DebtSchedule(std::move(tranches), static_cast<int>(dates.size()));
}

} // namespace proforma
