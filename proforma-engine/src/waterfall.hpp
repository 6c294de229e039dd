#ifndef PROFORMA_WATERFALL_HPP
#define PROFORMA_WATERFALL_HPP

#include "calendar.hpp"
#include "returns.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proforma {

enum class EquityClass : uint8_t {
    LP = 0,
    GP = 1
};

constexpr size_t kEquityClasses = 2;

struct WaterfallTier {
    std::string name;
    double pref_rate;           // Annual hurdle rate
    double lp_split;
    double gp_split;
    double promote;             // GP promote, on top of the GP split

    WaterfallTier();
    WaterfallTier(std::string tier_name, double rate, double lp, double gp, double gp_promote);

    // Throws ValidationError unless lp + gp + promote is 1 within 1e-3
    void validate() const;
};

struct WaterfallConfig {
    double lp_share;            // LP share of each contribution
    double gp_share;
    bool compound_monthly;      // true: pref accrues at r/12; false: (1+r)^(1/12)-1
    std::vector<WaterfallTier> tiers;
    WaterfallTier final_split;

    // Hurdle I 5% 90/10, Hurdles II and III 5% 75/8.33 + 16.67, final 75/8.33/16.67
    WaterfallConfig();

    double monthly_pref_rate(double annual_rate) const;
    void validate() const;
};

struct TierDistribution {
    double paid[kEquityClasses] = {0.0, 0.0};   // Cash to each class in this tier
    double promote = 0.0;                       // Extra GP cash earned in this tier
    double balance[kEquityClasses] = {0.0, 0.0};// Ending account balance
};

struct WaterfallPeriod {
    int period = 0;
    Date date;
    double cash_flow = 0.0;                     // Levered cash flow
    double contribution[kEquityClasses] = {0.0, 0.0};
    std::vector<TierDistribution> tiers;
    double final_split[kEquityClasses] = {0.0, 0.0};
    double final_promote = 0.0;
    double capital_returned[kEquityClasses] = {0.0, 0.0};
    double total_distributed = 0.0;
    double total_promote = 0.0;
    double net_cash_flow[kEquityClasses] = {0.0, 0.0};  // Received - contributed
};

struct TierSummary {
    std::string name;
    double paid[kEquityClasses] = {0.0, 0.0};
    double promote = 0.0;
    double unpaid_pref[kEquityClasses] = {0.0, 0.0};    // At termination, not force-paid
};

struct WaterfallResult {
    std::vector<WaterfallPeriod> periods;
    std::vector<TierSummary> tiers;
    double final_split[kEquityClasses] = {0.0, 0.0};
    double final_promote = 0.0;
    double contributed[kEquityClasses] = {0.0, 0.0};
    double distributed[kEquityClasses] = {0.0, 0.0};    // Includes GP promote
    double total_distributed = 0.0;
    double total_positive_cash_flow = 0.0;

    // Empty when a class's flows do not change sign or the solver finds no
    // root; the reason is in warnings
    std::optional<double> irr[kEquityClasses];
    std::optional<double> multiple[kEquityClasses];
    std::vector<std::string> warnings;

    std::vector<double> net_cash_flows(EquityClass cls) const;
};

// Run the tiered LP/GP waterfall over a levered cash-flow series.
//
// Each period, contributions (negative flows) are split by equity share and
// positive flows are distributed tier by tier. Per tier and class the
// account is
//   balance = balance x (1 + m) + contribution - cash received this period
// where cash received counts every earlier tier in the same period.
// Within a tier the cash is shared pro rata to the LP/GP splits, each class
// capped at its account, plus GP promote = paid x promote / (lp + gp).
// Cash reaches the next tier only once both accounts are met; whatever is
// left after the last tier goes to the final split. Every positive dollar is
// distributed exactly once.
WaterfallResult run_waterfall(
    const std::vector<double>& levered_cash_flows,
    const std::vector<Date>& dates,
    const WaterfallConfig& config = WaterfallConfig(),
    const SolverOptions& solver = SolverOptions()
);

} // namespace proforma

#endif // PROFORMA_WATERFALL_HPP
