#include "returns.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace proforma {

SolverOptions::SolverOptions()
    : initial_guess(0.10)
    , tolerance(1e-7)
    , max_iterations(100)
    , lower_bound(-0.99)
    , upper_bound(10.0) {}

namespace {

constexpr int kBracketSteps = 400;

void check_sign_change(const std::vector<double>& cash_flows) {
    if (cash_flows.size() < 2) {
        throw DegenerateCashFlowError("IRR needs at least two cash flows, got " +
                                      std::to_string(cash_flows.size()));
    }
    bool any_positive = std::any_of(cash_flows.begin(), cash_flows.end(), [](double cf) { return cf > 0.0; });
    bool any_negative = std::any_of(cash_flows.begin(), cash_flows.end(), [](double cf) { return cf < 0.0; });
    if (!(any_positive && any_negative)) {
        throw DegenerateCashFlowError("IRR undefined: cash flows never change sign");
    }
}

// Discounted value and derivative at rate for flows at year fractions t
struct Discounter {
    const std::vector<double>& cash_flows;
    std::vector<double> times;

    double value(double rate) const {
        double total = 0.0;
        for (size_t i = 0; i < cash_flows.size(); ++i) {
            total += cash_flows[i] / std::pow(1.0 + rate, times[i]);
        }
        return total;
    }

    double derivative(double rate) const {
        double total = 0.0;
        for (size_t i = 0; i < cash_flows.size(); ++i) {
            total -= times[i] * cash_flows[i] / std::pow(1.0 + rate, times[i] + 1.0);
        }
        return total;
    }
};

// Newton, then bracketed bisection. Never returns an unconverged rate.
double solve_rate(const Discounter& d, const SolverOptions& options, const char* solver_name) {
    double rate = options.initial_guess;
    std::string reason = "iteration limit reached";
    int iterations = 0;

    for (; iterations < options.max_iterations; ++iterations) {
        const double f = d.value(rate);
        const double df = d.derivative(rate);
        if (!std::isfinite(f) || !std::isfinite(df) || df == 0.0) {
            reason = "derivative vanished or not finite";
            break;
        }
        const double next = rate - f / df;
        if (!std::isfinite(next) || next <= -1.0) {
            reason = "step left the domain (rate <= -100%)";
            break;
        }
        if (std::fabs(next - rate) < options.tolerance) {
            return next;
        }
        rate = next;
    }

    Logger::get_instance().log_solver_fallback(solver_name, iterations, reason);

    // Scan the bracket for the first sign change, then bisect it
    const double step = (options.upper_bound - options.lower_bound) / kBracketSteps;
    double lo = options.lower_bound;
    double f_lo = d.value(lo);
    for (int i = 1; i <= kBracketSteps; ++i) {
        double hi = options.lower_bound + step * i;
        double f_hi = d.value(hi);
        if (f_lo == 0.0) {
            return lo;
        }
        if (std::isfinite(f_lo) && std::isfinite(f_hi) && (f_lo < 0.0) != (f_hi < 0.0)) {
            for (int k = 0; k < 200 && (hi - lo) > options.tolerance; ++k) {
                const double mid = 0.5 * (lo + hi);
                const double f_mid = d.value(mid);
                if ((f_mid < 0.0) == (f_lo < 0.0)) {
                    lo = mid;
                    f_lo = f_mid;
                } else {
                    hi = mid;
                }
            }
            return 0.5 * (lo + hi);
        }
        lo = hi;
        f_lo = f_hi;
    }

    throw ConvergenceError(std::string(solver_name) + " did not converge: " + reason +
                           ", and no root in [" + std::to_string(options.lower_bound) + ", " +
                           std::to_string(options.upper_bound) + "]");
}

} // anonymous namespace

double npv(double rate, const std::vector<double>& cash_flows) {
    double total = 0.0;
    double factor = 1.0;
    for (double cf : cash_flows) {
        total += cf / factor;
        factor *= (1.0 + rate);
    }
    return total;
}

double xnpv(double rate, const std::vector<double>& cash_flows, const std::vector<Date>& dates) {
    if (cash_flows.size() != dates.size()) {
        throw ValidationError("Cash flow and date series differ in length");
    }
    if (cash_flows.empty()) {
        return 0.0;
    }
    Discounter d{cash_flows, {}};
    d.times.reserve(dates.size());
    for (const auto& date : dates) {
        d.times.push_back(days_between(dates.front(), date) / 365.0);
    }
    return d.value(rate);
}

double xirr(
    const std::vector<double>& cash_flows,
    const std::vector<Date>& dates,
    const SolverOptions& options)
{
    if (cash_flows.size() != dates.size()) {
        throw ValidationError("Cash flow and date series differ in length");
    }
    for (size_t i = 1; i < dates.size(); ++i) {
        if (!(dates[i - 1] < dates[i])) {
            throw ValidationError("XIRR dates must be strictly increasing at " + dates[i].to_string());
        }
    }
    check_sign_change(cash_flows);

    Discounter d{cash_flows, {}};
    d.times.reserve(dates.size());
    for (const auto& date : dates) {
        d.times.push_back(days_between(dates.front(), date) / 365.0);
    }
    return solve_rate(d, options, "xirr");
}

double irr(const std::vector<double>& cash_flows, const SolverOptions& options) {
    check_sign_change(cash_flows);

    Discounter d{cash_flows, {}};
    d.times.reserve(cash_flows.size());
    for (size_t i = 0; i < cash_flows.size(); ++i) {
        d.times.push_back(static_cast<double>(i));
    }
    return solve_rate(d, options, "irr");
}

double equity_multiple(const std::vector<double>& cash_flows) {
    double inflows = 0.0;
    double outflows = 0.0;
    for (double cf : cash_flows) {
        if (cf > 0.0) {
            inflows += cf;
        } else {
            outflows -= cf;
        }
    }
    if (outflows <= 0.0) {
        throw DegenerateCashFlowError("Equity multiple undefined: no invested capital");
    }
    return inflows / outflows;
}

double profit(const std::vector<double>& cash_flows) {
    double total = 0.0;
    for (double cf : cash_flows) {
        total += cf;
    }
    return total;
}

std::vector<double> cash_on_cash(const std::vector<double>& annual_operating_cf, double equity) {
    if (!(equity > 0.0)) {
        throw DivideByZeroError("Cash-on-cash undefined: equity invested must be positive");
    }
    std::vector<double> out;
    out.reserve(annual_operating_cf.size());
    for (double cf : annual_operating_cf) {
        out.push_back(cf / equity);
    }
    return out;
}

double average(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (double v : values) {
        total += v;
    }
    return total / static_cast<double>(values.size());
}

} // namespace proforma
