#ifndef PROFORMA_DEBT_SCHEDULE_HPP
#define PROFORMA_DEBT_SCHEDULE_HPP

#include "calendar.hpp"
#include "loan.hpp"
#include "rate_curve.hpp"
#include <string>
#include <vector>

namespace proforma {

// One period of a tranche, or of the sum over tranches
struct DebtPeriod {
    int period = 0;
    double beginning_balance = 0.0;
    double draws = 0.0;
    double annual_rate = 0.0;            // Effective rate (fixed, or index + spread)
    double interest = 0.0;
    double scheduled_amortization = 0.0;
    double prepayment = 0.0;             // Non-amortizing paydown, <= 0
    double principal_paydown = 0.0;      // scheduled_amortization - prepayment
    double debt_service = 0.0;           // interest + principal_paydown
    double fees = 0.0;                   // Origination and closing, first draw only
    double ending_balance = 0.0;
};

struct TrancheSchedule {
    std::string loan_id;
    double principal = 0.0;
    std::vector<DebtPeriod> periods;
};

class DebtSchedule {
public:
    DebtSchedule() = default;
    DebtSchedule(std::vector<TrancheSchedule> tranches, int num_periods);

    // Summed over tranches; throws std::out_of_range for an unknown period
    const DebtPeriod& at(int period) const;

    const std::vector<DebtPeriod>& totals() const { return totals_; }
    const std::vector<TrancheSchedule>& tranches() const { return tranches_; }

    // Outstanding balance after the given period, repaid at exit
    double payoff(int exit_period) const { return at(exit_period).ending_balance; }

    double total_principal() const;
    bool empty() const { return tranches_.empty(); }

private:
    std::vector<TrancheSchedule> tranches_;
    std::vector<DebtPeriod> totals_;
};

// Schedule one tranche over dates[0..hold]. Period 0 carries no interest.
//
// Each period:
//   interest = avg(begin, begin + draws) x rate x days / 365   (Actual365)
//            = avg(begin, begin + draws) x rate / 12           (Monthly)
//   t <= io_months: no amortization
//   t >  io_months: payment = PMT(rate/12, remaining term, begin),
//                   amortization = payment - interest, within [0, balance]
//   end = begin + draws + prepayment - amortization
//
// Floating tranches look up the index on each period's date and need a
// non-empty curve (ValidationError); lookups outside the curve throw
// RateCurveRangeError. A negative ending balance throws InvariantViolation.
TrancheSchedule schedule_tranche(
    const Loan& loan,
    const std::vector<Date>& dates,
    const RateCurve& curve,
    double acquisition_cost
);

DebtSchedule build_debt_schedule(
    const std::vector<Loan>& loans,
    const std::vector<Date>& dates,
    const RateCurve& curve,
    double acquisition_cost
);

} // namespace proforma

#endif // PROFORMA_DEBT_SCHEDULE_HPP
