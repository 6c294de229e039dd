#ifndef PROFORMA_MODEL_HPP
#define PROFORMA_MODEL_HPP

#include "cashflow.hpp"
#include "debt_schedule.hpp"
#include "exit_valuation.hpp"
#include "loan.hpp"
#include "rate_curve.hpp"
#include "returns.hpp"
#include "scenario.hpp"
#include "tenant.hpp"
#include "waterfall.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace proforma {

// Everything one calculation run reads. Not mutated by the run.
struct ModelInputs {
    ScenarioParameters scenario;
    TenantSet tenants;
    std::vector<Loan> loans;
    RateCurve rate_curve;
    WaterfallConfig waterfall;
};

// Per-run switches
struct ModelConfig {
    bool resolve_circular;      // Solve the management-fee reimbursement fixed point
    double discount_rate;       // Annual, for the reported NPV
    SolverOptions solver;
    bool include_waterfall;

    ModelConfig();
};

struct ReturnsSummary {
    double unlevered_irr;
    double levered_irr;
    double unlevered_irr_periodic;     // Monthly IRR annualised
    double unlevered_multiple;
    double levered_multiple;
    double unlevered_profit;
    double levered_profit;
    double total_investment;           // Purchase + closing
    double loan_amount;
    double equity_invested;            // Sum of negative levered flows
    double unlevered_npv;              // At discount_rate, date-weighted
    std::vector<double> cash_on_cash;  // Per hold year
    double average_cash_on_cash;
    double month1_noi;
    double exit_noi;                   // NOI in the exit period

    ReturnsSummary();
};

struct ModelResult {
    std::string scenario_id;
    CashFlowTable cash_flows;
    DebtSchedule debt;
    ExitValuation exit;
    ReturnsSummary returns;
    std::optional<WaterfallResult> waterfall;
    std::vector<std::string> warnings;
};

// Validate, project, assemble. Throws ValidationError, NumericError
// subclasses or InvariantViolation; never returns a partial result.
ModelResult run_model(const ModelInputs& inputs, const ModelConfig& config = ModelConfig());

// Outcome of one run at the calculation boundary
struct CalculationResponse {
    bool success;
    std::string error_kind;            // "validation", "convergence", ...
    std::string error_message;
    std::vector<std::string> warnings;
    std::optional<ModelResult> result; // Set only on success

    CalculationResponse();
};

// Runs the model, turning validation and numeric failures into a failed
// response. InvariantViolation is logged and rethrown.
CalculationResponse run_calculation(const ModelInputs& inputs, const ModelConfig& config = ModelConfig());

using CalculationRunner = std::function<CalculationResponse(const ModelInputs&, const ModelConfig&)>;

// Independent runs, in parallel when built with OpenMP. Responses are in
// input order. Any exception escaping a run (an invariant violation, or
// anything the calculation boundary does not convert) is rethrown after the
// batch finishes, the earliest input first.
std::vector<CalculationResponse> run_batch(
    const std::vector<ModelInputs>& batch,
    const ModelConfig& config = ModelConfig()
);

// Same, with each item evaluated by runner instead of run_calculation
std::vector<CalculationResponse> run_batch(
    const std::vector<ModelInputs>& batch,
    const ModelConfig& config,
    const CalculationRunner& runner
);

} // namespace proforma

#endif // PROFORMA_MODEL_HPP
