#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace proforma {
namespace io {

namespace {

std::string escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// Streams "key": value pairs with the separators and indentation handled
class ObjectWriter {
public:
    ObjectWriter(std::ostream& os, bool pretty, int depth)
        : os_(os), pretty_(pretty), depth_(depth) {
        os_ << "{";
    }

    ObjectWriter& number(const char* key, double value) {
        key_prefix(key);
        if (std::isfinite(value)) {
            os_ << value;
        } else {
            os_ << "null";
        }
        return *this;
    }

    ObjectWriter& integer(const char* key, long long value) {
        key_prefix(key);
        os_ << value;
        return *this;
    }

    ObjectWriter& text(const char* key, const std::string& value) {
        key_prefix(key);
        os_ << "\"" << escape(value) << "\"";
        return *this;
    }

    ObjectWriter& boolean(const char* key, bool value) {
        key_prefix(key);
        os_ << (value ? "true" : "false");
        return *this;
    }

    ObjectWriter& optional_number(const char* key, const std::optional<double>& value) {
        return number(key, value ? *value : std::nan(""));
    }

    // Caller writes the value immediately after
    std::ostream& raw(const char* key) {
        key_prefix(key);
        return os_;
    }

    void close() {
        newline(depth_);
        os_ << "}";
    }

    bool pretty() const { return pretty_; }
    int depth() const { return depth_; }

private:
    std::ostream& os_;
    bool pretty_;
    int depth_;
    bool first_ = true;

    void newline(int depth) {
        if (pretty_) {
            os_ << "\n" << std::string(static_cast<size_t>(depth) * 2, ' ');
        }
    }

    void key_prefix(const char* key) {
        if (!first_) {
            os_ << ",";
        }
        first_ = false;
        newline(depth_ + 1);
        os_ << "\"" << key << "\":" << (pretty_ ? " " : "");
    }
};

template <typename Item, typename Fn>
void write_array(std::ostream& os, bool pretty, int depth, const std::vector<Item>& items, Fn&& write_item) {
    os << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            os << ",";
        }
        if (pretty) {
            os << "\n" << std::string(static_cast<size_t>(depth + 1) * 2, ' ');
        }
        write_item(items[i], depth + 1);
    }
    if (pretty && !items.empty()) {
        os << "\n" << std::string(static_cast<size_t>(depth) * 2, ' ');
    }
    os << "]";
}

void write_summary(std::ostream& os, const ModelResult& result, bool pretty, int depth) {
    const ReturnsSummary& r = result.returns;
    ObjectWriter w(os, pretty, depth);
    w.text("scenario_id", result.scenario_id)
     .number("unlevered_irr", r.unlevered_irr)
     .number("levered_irr", r.levered_irr)
     .number("unlevered_irr_periodic", r.unlevered_irr_periodic)
     .number("unlevered_multiple", r.unlevered_multiple)
     .number("levered_multiple", r.levered_multiple)
     .number("unlevered_profit", r.unlevered_profit)
     .number("levered_profit", r.levered_profit)
     .number("total_investment", r.total_investment)
     .number("loan_amount", r.loan_amount)
     .number("equity_invested", r.equity_invested)
     .number("unlevered_npv", r.unlevered_npv)
     .number("average_cash_on_cash", r.average_cash_on_cash)
     .number("month1_noi", r.month1_noi)
     .number("exit_noi", r.exit_noi);
    write_array(w.raw("cash_on_cash"), pretty, depth + 1, r.cash_on_cash,
                [&os](double v, int) { os << v; });
    w.close();
}

void write_exit(std::ostream& os, const ExitValuation& exit, bool pretty, int depth) {
    ObjectWriter w(os, pretty, depth);
    w.integer("exit_period", exit.exit_period)
     .number("forward_noi", exit.forward_noi)
     .number("forward_capital_reserve", exit.forward_capital_reserve)
     .number("gross_value", exit.gross_value)
     .number("sales_costs", exit.sales_costs)
     .number("net_proceeds", exit.net_proceeds);
    w.close();
}

void write_monthly_row(std::ostream& os, const MonthlyRow& r, bool pretty, int depth) {
    ObjectWriter w(os, pretty, depth);
    w.integer("period", r.period)
     .text("date", r.date.to_string())
     .number("tenant_revenue", r.tenant_revenue)
     .number("free_rent", r.free_rent)
     .number("parking_income", r.parking_income)
     .number("storage_income", r.storage_income)
     .number("fixed_reimbursement", r.fixed_reimbursement)
     .number("variable_reimbursement", r.variable_reimbursement)
     .number("potential_revenue", r.potential_revenue)
     .number("vacancy", r.vacancy)
     .number("collection_loss", r.collection_loss)
     .number("effective_revenue", r.effective_revenue)
     .number("fixed_opex", r.fixed_opex)
     .number("variable_opex", r.variable_opex)
     .number("property_tax", r.property_tax)
     .number("parking_expense", r.parking_expense)
     .number("management_fee", r.management_fee)
     .number("capital_reserve", r.capital_reserve)
     .number("total_expenses", r.total_expenses)
     .number("noi", r.noi)
     .number("acquisition_cost", r.acquisition_cost)
     .number("leasing_costs", r.leasing_costs)
     .number("exit_proceeds", r.exit_proceeds)
     .number("unlevered_cf", r.unlevered_cf)
     .number("loan_draws", r.loan_draws)
     .number("interest", r.interest)
     .number("principal", r.principal)
     .number("debt_service", r.debt_service)
     .number("loan_fees", r.loan_fees)
     .number("loan_payoff", r.loan_payoff)
     .number("ending_loan_balance", r.ending_loan_balance)
     .number("levered_cf", r.levered_cf)
     .number("operating_levered_cf", r.operating_levered_cf);
    w.close();
}

void write_annual_row(std::ostream& os, const AnnualRow& a, bool pretty, int depth) {
    ObjectWriter w(os, pretty, depth);
    w.integer("year", a.year)
     .number("potential_revenue", a.potential_revenue)
     .number("effective_revenue", a.effective_revenue)
     .number("total_expenses", a.total_expenses)
     .number("noi", a.noi)
     .number("debt_service", a.debt_service)
     .number("leasing_costs", a.leasing_costs)
     .number("unlevered_cf", a.unlevered_cf)
     .number("levered_cf", a.levered_cf)
     .number("operating_levered_cf", a.operating_levered_cf);
    w.close();
}

void write_waterfall(std::ostream& os, const WaterfallResult& wf, bool pretty, int depth) {
    ObjectWriter w(os, pretty, depth);
    w.optional_number("lp_irr", wf.irr[0])
     .optional_number("gp_irr", wf.irr[1])
     .optional_number("lp_multiple", wf.multiple[0])
     .optional_number("gp_multiple", wf.multiple[1])
     .number("lp_contributed", wf.contributed[0])
     .number("gp_contributed", wf.contributed[1])
     .number("lp_distributed", wf.distributed[0])
     .number("gp_distributed", wf.distributed[1])
     .number("final_split_lp", wf.final_split[0])
     .number("final_split_gp", wf.final_split[1])
     .number("final_promote", wf.final_promote)
     .number("total_distributed", wf.total_distributed);

    write_array(w.raw("tiers"), pretty, depth + 1, wf.tiers,
        [&os, pretty](const TierSummary& t, int d) {
            ObjectWriter tw(os, pretty, d);
            tw.text("name", t.name)
              .number("lp_paid", t.paid[0])
              .number("gp_paid", t.paid[1])
              .number("promote", t.promote)
              .number("lp_unpaid_pref", t.unpaid_pref[0])
              .number("gp_unpaid_pref", t.unpaid_pref[1]);
            tw.close();
        });

    write_array(w.raw("periods"), pretty, depth + 1, wf.periods,
        [&os, pretty](const WaterfallPeriod& p, int d) {
            ObjectWriter pw(os, pretty, d);
            pw.integer("period", p.period)
              .text("date", p.date.to_string())
              .number("cash_flow", p.cash_flow)
              .number("lp_contribution", p.contribution[0])
              .number("gp_contribution", p.contribution[1]);
            write_array(pw.raw("tiers"), pretty, d + 1, p.tiers,
                [&os, pretty](const TierDistribution& td, int dd) {
                    ObjectWriter tw(os, pretty, dd);
                    tw.number("lp", td.paid[0])
                      .number("gp", td.paid[1])
                      .number("promote", td.promote)
                      .number("lp_balance", td.balance[0])
                      .number("gp_balance", td.balance[1]);
                    tw.close();
                });
            pw.number("final_split_lp", p.final_split[0])
              .number("final_split_gp", p.final_split[1])
              .number("final_promote", p.final_promote)
              .number("lp_capital_returned", p.capital_returned[0])
              .number("gp_capital_returned", p.capital_returned[1])
              .number("total_distributed", p.total_distributed)
              .number("lp_net_cash_flow", p.net_cash_flow[0])
              .number("gp_net_cash_flow", p.net_cash_flow[1]);
            pw.close();
        });
    w.close();
}

} // anonymous namespace

void write_model_result_json(std::ostream& os, const ModelResult& result, bool pretty_print) {
    os << std::fixed << std::setprecision(6);

    ObjectWriter root(os, pretty_print, 0);
    root.boolean("success", true);
    write_summary(root.raw("summary"), result, pretty_print, 1);
    write_exit(root.raw("exit"), result.exit, pretty_print, 1);
    write_array(root.raw("warnings"), pretty_print, 1, result.warnings,
                [&os](const std::string& s, int) { os << "\"" << escape(s) << "\""; });
    write_array(root.raw("monthly"), pretty_print, 1, result.cash_flows.rows,
                [&os, pretty_print](const MonthlyRow& r, int d) { write_monthly_row(os, r, pretty_print, d); });
    write_array(root.raw("annual"), pretty_print, 1, result.cash_flows.annual,
                [&os, pretty_print](const AnnualRow& a, int d) { write_annual_row(os, a, pretty_print, d); });
    if (result.waterfall) {
        write_waterfall(root.raw("waterfall"), *result.waterfall, pretty_print, 1);
    } else {
        root.raw("waterfall") << "null";
    }
    root.close();
    os << "\n";
}

void write_model_result_json(const std::string& filepath, const ModelResult& result, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_model_result_json(file, result, pretty_print);
}

void write_error_json(std::ostream& os, const CalculationResponse& response) {
    ObjectWriter w(os, true, 0);
    w.boolean("success", response.success)
     .text("error_kind", response.error_kind)
     .text("error_message", response.error_message);
    w.close();
    os << "\n";
}

} // namespace io
} // namespace proforma
