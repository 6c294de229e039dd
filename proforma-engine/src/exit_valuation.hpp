#ifndef PROFORMA_EXIT_VALUATION_HPP
#define PROFORMA_EXIT_VALUATION_HPP

#include <vector>

namespace proforma {

struct ExitValuation {
    int exit_period = 0;
    double forward_noi = 0.0;              // Includes the reserve add-back
    double forward_capital_reserve = 0.0;
    double gross_value = 0.0;
    double sales_costs = 0.0;
    double net_proceeds = 0.0;
};

// Capitalise the 12 periods after exit_period:
//   forward = sum(noi + capital_reserve) over exit+1 .. exit+12
//   gross   = forward / cap_rate
//   net     = gross x (1 - sales_cost_rate)
// Throws DivideByZeroError for cap_rate <= 0 and std::out_of_range when
// the series do not reach exit+12.
ExitValuation value_exit(
    const std::vector<double>& noi,
    const std::vector<double>& capital_reserve,
    int exit_period,
    double cap_rate,
    double sales_cost_rate
);

} // namespace proforma

#endif // PROFORMA_EXIT_VALUATION_HPP
