#include "exit_valuation.hpp"
#include "errors.hpp"
#include "scenario.hpp"
#include <string>

namespace proforma {

ExitValuation value_exit(
    const std::vector<double>& noi,
    const std::vector<double>& capital_reserve,
    int exit_period,
    double cap_rate,
    double sales_cost_rate)
{
    if (!(cap_rate > 0.0)) {
        throw DivideByZeroError("Exit cap rate must be positive, got " + std::to_string(cap_rate));
    }
    const size_t last = static_cast<size_t>(exit_period) + kForwardPeriods;
    if (exit_period < 0 || noi.size() <= last || capital_reserve.size() <= last) {
        throw std::out_of_range("Forward NOI window beyond projection for exit period " +
                                std::to_string(exit_period));
    }

    ExitValuation exit;
    exit.exit_period = exit_period;
    double forward_noi = 0.0;
    for (size_t t = static_cast<size_t>(exit_period) + 1; t <= last; ++t) {
        forward_noi += noi[t];
        exit.forward_capital_reserve += capital_reserve[t];
    }
    exit.forward_noi = forward_noi + exit.forward_capital_reserve;
    exit.gross_value = exit.forward_noi / cap_rate;
    exit.sales_costs = exit.gross_value * sales_cost_rate;
    exit.net_proceeds = exit.gross_value - exit.sales_costs;
    return exit;
}

} // namespace proforma
