#include "model.hpp"
#include "errors.hpp"
#include "escalation.hpp"
#include "logger.hpp"
#include "noi.hpp"
#include "operating_expenses.hpp"
#include "rent_roll.hpp"
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace proforma {

ModelConfig::ModelConfig()
    : resolve_circular(false)
    , discount_rate(0.10)
    , solver()
    , include_waterfall(true) {}

ReturnsSummary::ReturnsSummary()
    : unlevered_irr(0.0)
    , levered_irr(std::numeric_limits<double>::quiet_NaN())
    , unlevered_irr_periodic(0.0)
    , unlevered_multiple(0.0)
    , levered_multiple(0.0)
    , unlevered_profit(0.0)
    , levered_profit(0.0)
    , total_investment(0.0)
    , loan_amount(0.0)
    , equity_invested(0.0)
    , unlevered_npv(0.0)
    , average_cash_on_cash(0.0)
    , month1_noi(0.0)
    , exit_noi(0.0) {}

CalculationResponse::CalculationResponse()
    : success(false) {}

namespace {

RunContext make_context(const ModelInputs& inputs) {
    RunContext ctx(inputs.scenario.scenario_id);
    ctx.hold_months = inputs.scenario.hold_months;
    ctx.tenant_count = inputs.tenants.size();
    ctx.loan_count = inputs.loans.size();
    return ctx;
}

void validate_inputs(const ModelInputs& inputs) {
    inputs.scenario.validate();
    inputs.tenants.validate(inputs.scenario.building_area);
    for (const auto& loan : inputs.loans) {
        loan.validate(inputs.scenario.hold_months);
        if (loan.rate_mode == RateMode::Floating && inputs.rate_curve.empty()) {
            throw ValidationError("Loan '" + loan.id + "' is floating but no rate curve was supplied");
        }
    }
    inputs.waterfall.validate();
}

const char* numeric_error_kind(const NumericError& e) {
    if (dynamic_cast<const ConvergenceError*>(&e)) return "convergence";
    if (dynamic_cast<const DegenerateCashFlowError*>(&e)) return "degenerate_cash_flow";
    if (dynamic_cast<const DivideByZeroError*>(&e)) return "divide_by_zero";
    if (dynamic_cast<const RateCurveRangeError*>(&e)) return "rate_curve_range";
    return "numeric";
}

} // anonymous namespace

// ============================================================================
// Single run
// ============================================================================

ModelResult run_model(const ModelInputs& inputs, const ModelConfig& config) {
    validate_inputs(inputs);

    const ScenarioParameters& s = inputs.scenario;
    const int hold = s.hold_months;
    const int periods = s.projection_periods();

    // Escalation series cover the forward buffer
    const std::vector<double> rent_esc = rent_escalation(
        periods, s.escalation.rent_growth,
        s.escalation.post_stabilization_rent_growth, s.escalation.stabilization_month);
    const std::vector<double> expense_esc = expense_escalation(periods, s.escalation.expense_growth);
    const std::vector<double> tax_steps = property_tax_steps(periods, s.property_tax.growth, s.property_tax.start_month);

    const std::vector<Date> all_dates = generate_monthly_dates(s.acquisition_date, periods);
    const std::vector<Date> hold_dates(all_dates.begin(), all_dates.begin() + hold + 1);

    const RentRollProjection revenue = project_rent_roll(inputs.tenants, s, rent_esc);
    const ExpenseProjection expenses = project_expenses(s, expense_esc, tax_steps, revenue.parking_income);
    const NoiProjection noi = aggregate_noi(s, revenue, expenses, config.resolve_circular);

    ModelResult result;
    result.scenario_id = s.scenario_id;
    result.debt = build_debt_schedule(inputs.loans, hold_dates, inputs.rate_curve, s.total_acquisition_cost());
    result.exit = value_exit(noi.noi, expenses.capital_reserve, hold, s.exit_cap_rate, s.sales_cost_rate);
    result.cash_flows = assemble_cash_flows(s, hold_dates, revenue, expenses, noi, result.debt, result.exit);

    const std::vector<double> unlevered = result.cash_flows.unlevered();
    const std::vector<double> levered = result.cash_flows.levered();

    ReturnsSummary& r = result.returns;
    r.total_investment = s.total_acquisition_cost();
    r.loan_amount = result.debt.total_principal();
    r.month1_noi = noi.noi[1];
    r.exit_noi = noi.noi[hold];

    r.unlevered_irr = xirr(unlevered, hold_dates, config.solver);
    r.unlevered_irr_periodic = annualize_monthly_rate(irr(unlevered, config.solver));
    r.unlevered_multiple = equity_multiple(unlevered);
    r.unlevered_profit = profit(unlevered);
    r.unlevered_npv = xnpv(config.discount_rate, unlevered, hold_dates);

    for (double cf : levered) {
        if (cf < 0.0) {
            r.equity_invested -= cf;
        }
    }
    r.levered_profit = profit(levered);
    if (!inputs.loans.empty()) {
        r.levered_irr = xirr(levered, hold_dates, config.solver);
        r.levered_multiple = equity_multiple(levered);
    } else {
        r.levered_irr = r.unlevered_irr;
        r.levered_multiple = r.unlevered_multiple;
    }

    std::vector<double> annual_operating;
    annual_operating.reserve(result.cash_flows.annual.size());
    for (const auto& a : result.cash_flows.annual) {
        annual_operating.push_back(a.operating_levered_cf);
    }
    r.cash_on_cash = cash_on_cash(annual_operating, r.equity_invested);
    r.average_cash_on_cash = average(r.cash_on_cash);

    if (config.include_waterfall) {
        result.waterfall = run_waterfall(levered, hold_dates, inputs.waterfall, config.solver);
        result.warnings.insert(result.warnings.end(),
                               result.waterfall->warnings.begin(), result.waterfall->warnings.end());
    }

    return result;
}

// ============================================================================
// Calculation boundary
// ============================================================================

CalculationResponse run_calculation(const ModelInputs& inputs, const ModelConfig& config) {
    Logger& logger = Logger::get_instance();
    const RunContext ctx = make_context(inputs);
    CalculationResponse response;

    auto start_time = std::chrono::high_resolution_clock::now();
    logger.log_run_start(ctx);

    try {
        ModelResult result = run_model(inputs, config);
        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

        logger.log_run_complete(ctx, result.returns.unlevered_irr, result.returns.levered_irr,
                                result.exit.net_proceeds, elapsed_ms);
        for (const auto& w : result.warnings) {
            logger.warn(w, {{"scenario_id", ctx.scenario_id}});
        }

        response.success = true;
        response.warnings = result.warnings;
        response.result = std::move(result);
    } catch (const ValidationError& e) {
        logger.log_validation_failed(ctx, e.what());
        response.error_kind = "validation";
        response.error_message = e.what();
    } catch (const NumericError& e) {
        response.error_kind = numeric_error_kind(e);
        response.error_message = e.what();
        logger.log_numeric_failure(ctx, response.error_kind, e.what());
    } catch (const InvariantViolation& e) {
        logger.log_invariant_violation(ctx, e.what());
        throw;
    }

    return response;
}

std::vector<CalculationResponse> run_batch(
    const std::vector<ModelInputs>& batch,
    const ModelConfig& config)
{
    return run_batch(batch, config, run_calculation);
}

std::vector<CalculationResponse> run_batch(
    const std::vector<ModelInputs>& batch,
    const ModelConfig& config,
    const CalculationRunner& runner)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    std::vector<CalculationResponse> responses(batch.size());
    std::vector<std::exception_ptr> fatal(batch.size());
    const long n = static_cast<long>(batch.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long i = 0; i < n; ++i) {
        try {
            responses[i] = runner(batch[i], config);
        } catch (...) {
            // Rethrown after the parallel region; exceptions cannot cross it
            fatal[i] = std::current_exception();
        }
    }

    size_t failures = 0;
    for (const auto& r : responses) {
        if (!r.success) {
            ++failures;
        }
    }
    auto end_time = std::chrono::high_resolution_clock::now();
    Logger::get_instance().log_batch_complete(
        batch.size(), failures,
        std::chrono::duration<double, std::milli>(end_time - start_time).count());

    for (const auto& ep : fatal) {
        if (ep) {
            std::rethrow_exception(ep);
        }
    }
    return responses;
}

} // namespace proforma
