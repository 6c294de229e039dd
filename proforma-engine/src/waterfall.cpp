#include "waterfall.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace proforma {

WaterfallTier::WaterfallTier()
    : name("")
    , pref_rate(0.0)
    , lp_split(1.0)
    , gp_split(0.0)
    , promote(0.0) {}

WaterfallTier::WaterfallTier(std::string tier_name, double rate, double lp, double gp, double gp_promote)
    : name(std::move(tier_name))
    , pref_rate(rate)
    , lp_split(lp)
    , gp_split(gp)
    , promote(gp_promote) {}

void WaterfallTier::validate() const {
    if (lp_split < 0.0 || gp_split < 0.0 || promote < 0.0) {
        throw ValidationError("Waterfall tier '" + name + "': splits must be non-negative");
    }
    if (!(lp_split + gp_split > 0.0)) {
        throw ValidationError("Waterfall tier '" + name + "': LP and GP splits are both zero");
    }
    const double total = lp_split + gp_split + promote;
    if (std::fabs(total - 1.0) > 1e-3) {
        throw ValidationError("Waterfall tier '" + name + "': splits sum to " +
                              std::to_string(total) + ", expected 1");
    }
    if (!(pref_rate > -1.0)) {
        throw ValidationError("Waterfall tier '" + name + "': pref rate must exceed -100%");
    }
}

WaterfallConfig::WaterfallConfig()
    : lp_share(0.90)
    , gp_share(0.10)
    , compound_monthly(false)
    , tiers{
        WaterfallTier("Hurdle I", 0.05, 0.90, 0.10, 0.0),
        WaterfallTier("Hurdle II", 0.05, 0.75, 0.0833, 0.1667),
        WaterfallTier("Hurdle III", 0.05, 0.75, 0.0833, 0.1667)}
    , final_split("Final Split", 0.0, 0.75, 0.0833, 0.1667) {}

double WaterfallConfig::monthly_pref_rate(double annual_rate) const {
    if (compound_monthly) {
        return annual_rate / 12.0;
    }
    return std::pow(1.0 + annual_rate, 1.0 / 12.0) - 1.0;
}

void WaterfallConfig::validate() const {
    if (lp_share < 0.0 || gp_share < 0.0 || std::fabs(lp_share + gp_share - 1.0) > 1e-9) {
        throw ValidationError("LP and GP equity shares must be non-negative and sum to 1");
    }
    for (const auto& tier : tiers) {
        tier.validate();
    }
    final_split.validate();
}

std::vector<double> WaterfallResult::net_cash_flows(EquityClass cls) const {
    const size_t k = static_cast<size_t>(cls);
    std::vector<double> out;
    out.reserve(periods.size());
    for (const auto& p : periods) {
        out.push_back(p.net_cash_flow[k]);
    }
    return out;
}

namespace {

// Relative overshoot of tier payouts treated as rounding rather than a fault
constexpr double kCashTolerance = 1e-9;

// Split cash between the two classes pro rata to weights, each capped at
// need; capacity a capped class cannot use moves to the other.
void fill_pro_rata(double cash, const double weight[kEquityClasses],
                   const double need[kEquityClasses], double out[kEquityClasses])
{
    out[0] = out[1] = 0.0;
    const double w_total = weight[0] + weight[1];
    if (cash <= 0.0 || w_total <= 0.0) {
        return;
    }
    // The second share is taken from what the first leaves so the two never
    // sum past cash
    out[0] = std::min(need[0], cash * weight[0] / w_total);
    out[1] = std::min(need[1], std::max(0.0, cash - out[0]));
    double left = cash - out[0] - out[1];
    for (size_t k = 0; k < kEquityClasses && left > 0.0; ++k) {
        const double room = need[k] - out[k];
        if (room > 0.0) {
            const double extra = std::min(room, left);
            out[k] += extra;
            left -= extra;
        }
    }
}

const char* const kClassNames[kEquityClasses] = {"LP", "GP"};

// A class IRR that cannot be solved is left empty with a warning
std::optional<double> try_xirr(const std::vector<double>& flows, const std::vector<Date>& dates,
                               const SolverOptions& solver, EquityClass cls,
                               std::vector<std::string>& warnings)
{
    const std::string name = kClassNames[static_cast<size_t>(cls)];
    try {
        return xirr(flows, dates, solver);
    } catch (const DegenerateCashFlowError&) {
        warnings.push_back(name + " cash flows never change sign; IRR not reported");
    } catch (const ConvergenceError& e) {
        warnings.push_back(name + " IRR not reported: " + e.what());
    }
    return std::nullopt;
}

std::optional<double> try_multiple(const std::vector<double>& flows) {
    try {
        return equity_multiple(flows);
    } catch (const DegenerateCashFlowError&) {
        return std::nullopt;
    }
}

} // anonymous namespace

WaterfallResult run_waterfall(
    const std::vector<double>& levered_cash_flows,
    const std::vector<Date>& dates,
    const WaterfallConfig& config,
    const SolverOptions& solver)
{
    if (levered_cash_flows.size() != dates.size()) {
        throw ValidationError("Waterfall cash flows and dates differ in length");
    }
    config.validate();

    const size_t num_tiers = config.tiers.size();
    const double shares[kEquityClasses] = {config.lp_share, config.gp_share};

    std::vector<double> monthly_rate(num_tiers);
    for (size_t i = 0; i < num_tiers; ++i) {
        monthly_rate[i] = config.monthly_pref_rate(config.tiers[i].pref_rate);
    }

    // Account balance per tier per class, carried between periods
    std::vector<std::array<double, kEquityClasses>> balance(num_tiers, {0.0, 0.0});
    double unreturned[kEquityClasses] = {0.0, 0.0};

    WaterfallResult result;
    result.tiers.resize(num_tiers);
    for (size_t i = 0; i < num_tiers; ++i) {
        result.tiers[i].name = config.tiers[i].name;
    }
    result.periods.reserve(levered_cash_flows.size());

    for (size_t t = 0; t < levered_cash_flows.size(); ++t) {
        WaterfallPeriod p;
        p.period = static_cast<int>(t);
        p.date = dates[t];
        p.cash_flow = levered_cash_flows[t];
        p.tiers.resize(num_tiers);

        const double contribution = std::max(0.0, -p.cash_flow);
        for (size_t k = 0; k < kEquityClasses; ++k) {
            p.contribution[k] = contribution * shares[k];
            unreturned[k] += p.contribution[k];
            result.contributed[k] += p.contribution[k];
        }

        double remaining = std::max(0.0, p.cash_flow);
        result.total_positive_cash_flow += remaining;
        double received[kEquityClasses] = {0.0, 0.0};

        // Accrue and add contributions before any cash moves
        for (size_t i = 0; i < num_tiers; ++i) {
            for (size_t k = 0; k < kEquityClasses; ++k) {
                balance[i][k] = balance[i][k] * (1.0 + monthly_rate[i]) + p.contribution[k];
            }
        }

        for (size_t i = 0; i < num_tiers; ++i) {
            const WaterfallTier& tier = config.tiers[i];
            TierDistribution& td = p.tiers[i];

            double need[kEquityClasses];
            for (size_t k = 0; k < kEquityClasses; ++k) {
                need[k] = std::max(0.0, balance[i][k] - received[k]);
            }

            if (remaining > 0.0 && need[0] + need[1] > 0.0) {
                const double promote_ratio = tier.promote / (tier.lp_split + tier.gp_split);
                const double pool = remaining / (1.0 + promote_ratio);
                const double weight[kEquityClasses] = {tier.lp_split, tier.gp_split};
                fill_pro_rata(pool, weight, need, td.paid);

                double paid = td.paid[0] + td.paid[1];
                if (paid > remaining) {
                    if (paid - remaining > kCashTolerance * std::max(1.0, remaining)) {
                        throw InvariantViolation("Tier '" + tier.name + "' paid " + std::to_string(paid) +
                                                 " from " + std::to_string(remaining) +
                                                 " available at period " + std::to_string(t));
                    }
                    // Rounding overshoot comes off the GP share
                    td.paid[1] = std::max(0.0, remaining - td.paid[0]);
                    paid = td.paid[0] + td.paid[1];
                }
                td.promote = std::max(0.0, std::min(remaining - paid, paid * promote_ratio));
                for (size_t k = 0; k < kEquityClasses; ++k) {
                    received[k] += td.paid[k];
                }
                remaining -= paid + td.promote;
                if (remaining < 0.0) {
                    remaining = 0.0;
                }
            }
        }

        if (remaining > 0.0) {
            const WaterfallTier& fs = config.final_split;
            const double total_split = fs.lp_split + fs.gp_split + fs.promote;
            p.final_split[0] = remaining * fs.lp_split / total_split;
            p.final_split[1] = remaining * fs.gp_split / total_split;
            p.final_promote = remaining - p.final_split[0] - p.final_split[1];
            received[0] += p.final_split[0];
            received[1] += p.final_split[1];
        }

        // Close the period: every account is reduced by all class cash
        for (size_t i = 0; i < num_tiers; ++i) {
            for (size_t k = 0; k < kEquityClasses; ++k) {
                balance[i][k] = std::max(0.0, balance[i][k] - received[k]);
                p.tiers[i].balance[k] = balance[i][k];
            }
        }

        double promote_total = p.final_promote;
        for (size_t i = 0; i < num_tiers; ++i) {
            promote_total += p.tiers[i].promote;
            result.tiers[i].paid[0] += p.tiers[i].paid[0];
            result.tiers[i].paid[1] += p.tiers[i].paid[1];
            result.tiers[i].promote += p.tiers[i].promote;
        }
        p.total_promote = promote_total;

        for (size_t k = 0; k < kEquityClasses; ++k) {
            p.capital_returned[k] = std::min(unreturned[k], received[k]);
            unreturned[k] -= p.capital_returned[k];
        }

        const double to_lp = received[0];
        const double to_gp = received[1] + promote_total;
        p.total_distributed = to_lp + to_gp;
        p.net_cash_flow[0] = to_lp - p.contribution[0];
        p.net_cash_flow[1] = to_gp - p.contribution[1];

        result.distributed[0] += to_lp;
        result.distributed[1] += to_gp;
        result.total_distributed += p.total_distributed;
        result.final_split[0] += p.final_split[0];
        result.final_split[1] += p.final_split[1];
        result.final_promote += p.final_promote;

        result.periods.push_back(std::move(p));
    }

    // Pref accrued in each account beyond the capital still outstanding
    for (size_t i = 0; i < num_tiers; ++i) {
        for (size_t k = 0; k < kEquityClasses; ++k) {
            result.tiers[i].unpaid_pref[k] = std::max(0.0, balance[i][k] - unreturned[k]);
        }
    }

    for (size_t k = 0; k < kEquityClasses; ++k) {
        auto flows = result.net_cash_flows(static_cast<EquityClass>(k));
        result.irr[k] = try_xirr(flows, dates, solver, static_cast<EquityClass>(k), result.warnings);
        result.multiple[k] = try_multiple(flows);
    }

    return result;
}

} // namespace proforma
