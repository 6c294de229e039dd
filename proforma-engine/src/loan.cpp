#include "loan.hpp"
#include "errors.hpp"
#include <cmath>

namespace proforma {

Loan::Loan()
    : id("loan")
    , principal(0.0)
    , ltc(std::nullopt)
    , rate_mode(RateMode::Fixed)
    , fixed_rate(0.0)
    , spread(0.0)
    , io_months(0)
    , amortization_months(360)
    , origination_fee_rate(0.0)
    , closing_cost_rate(0.0)
    , day_count(DayCount::Actual365) {}

double Loan::resolved_principal(double acquisition_cost) const {
    if (ltc) {
        return *ltc * acquisition_cost;
    }
    return principal;
}

void Loan::validate(int hold_months) const {
    const std::string who = "Loan '" + id + "': ";
    if (ltc) {
        if (!(*ltc >= 0.0 && *ltc <= 1.0)) {
            throw ValidationError(who + "ltc must be in [0, 1]");
        }
    } else if (!(principal >= 0.0)) {
        throw ValidationError(who + "principal must be non-negative");
    }
    if (io_months < 0) {
        throw ValidationError(who + "interest-only months must be non-negative");
    }
    if (amortization_months < 1) {
        throw ValidationError(who + "amortization term must be at least one month");
    }
    if (origination_fee_rate < 0.0 || closing_cost_rate < 0.0) {
        throw ValidationError(who + "fee rates must be non-negative");
    }
    if (rate_mode == RateMode::Fixed && !(fixed_rate > -1.0)) {
        throw ValidationError(who + "fixed rate must exceed -100%");
    }
    for (const auto& d : draws) {
        if (d.period < 0 || d.period > hold_months) {
            throw ValidationError(who + "draw period " + std::to_string(d.period) + " outside hold");
        }
        if (d.amount < 0.0) {
            throw ValidationError(who + "draw amounts must be non-negative");
        }
    }
    for (const auto& p : prepayments) {
        if (p.period < 1 || p.period > hold_months) {
            throw ValidationError(who + "prepayment period " + std::to_string(p.period) + " outside hold");
        }
        if (p.amount < 0.0) {
            throw ValidationError(who + "prepayment amounts must be non-negative");
        }
    }
}

double level_payment(double periodic_rate, int periods, double balance) {
    if (periods <= 0) {
        return balance;
    }
    if (periodic_rate == 0.0) {
        return balance / periods;
    }
    double growth = std::pow(1.0 + periodic_rate, periods);
    return balance * periodic_rate * growth / (growth - 1.0);
}

} // namespace proforma
