#ifndef PROFORMA_LOAN_HPP
#define PROFORMA_LOAN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proforma {

enum class RateMode : uint8_t {
    Fixed = 0,
    Floating = 1
};

enum class DayCount : uint8_t {
    Actual365 = 0,   // rate x actual days / 365
    Monthly = 1      // rate / 12
};

// Signed amount at a period. Draws are positive; prepayments are
// paydowns given as positive amounts and booked as a non-positive line.
struct ScheduledAmount {
    int period;
    double amount;
};

// One debt tranche
struct Loan {
    std::string id;
    double principal;                    // Money units; ignored when ltc is set
    std::optional<double> ltc;           // Loan-to-cost on purchase + closing
    RateMode rate_mode;
    double fixed_rate;
    double spread;                       // Over the index curve when floating
    int io_months;                       // Interest-only window from period 1
    int amortization_months;
    double origination_fee_rate;
    double closing_cost_rate;
    DayCount day_count;
    std::vector<ScheduledAmount> draws;  // Empty: full principal at period 0
    std::vector<ScheduledAmount> prepayments;

    Loan();

    double resolved_principal(double acquisition_cost) const;

    // Throws ValidationError
    void validate(int hold_months) const;
};

// Monthly level payment on balance over n periods at the periodic rate
double level_payment(double periodic_rate, int periods, double balance);

} // namespace proforma

#endif // PROFORMA_LOAN_HPP
