#include "parquet_writer.hpp"
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace proforma {
namespace io {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

using Column = std::pair<const char*, std::function<double(const MonthlyRow&)>>;

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_monthly(const CashFlowTable& table, const std::string& filepath) {
    if (table.rows.empty()) {
        throw std::runtime_error("Cash-flow table has no rows to write");
    }

    // Every MonthlyRow value, in the JSON writer's order
    const std::vector<Column> columns = {
        {"tenant_revenue", [](const MonthlyRow& r) { return r.tenant_revenue; }},
        {"free_rent", [](const MonthlyRow& r) { return r.free_rent; }},
        {"parking_income", [](const MonthlyRow& r) { return r.parking_income; }},
        {"storage_income", [](const MonthlyRow& r) { return r.storage_income; }},
        {"fixed_reimbursement", [](const MonthlyRow& r) { return r.fixed_reimbursement; }},
        {"variable_reimbursement", [](const MonthlyRow& r) { return r.variable_reimbursement; }},
        {"potential_revenue", [](const MonthlyRow& r) { return r.potential_revenue; }},
        {"vacancy", [](const MonthlyRow& r) { return r.vacancy; }},
        {"collection_loss", [](const MonthlyRow& r) { return r.collection_loss; }},
        {"effective_revenue", [](const MonthlyRow& r) { return r.effective_revenue; }},
        {"fixed_opex", [](const MonthlyRow& r) { return r.fixed_opex; }},
        {"variable_opex", [](const MonthlyRow& r) { return r.variable_opex; }},
        {"property_tax", [](const MonthlyRow& r) { return r.property_tax; }},
        {"parking_expense", [](const MonthlyRow& r) { return r.parking_expense; }},
        {"management_fee", [](const MonthlyRow& r) { return r.management_fee; }},
        {"capital_reserve", [](const MonthlyRow& r) { return r.capital_reserve; }},
        {"total_expenses", [](const MonthlyRow& r) { return r.total_expenses; }},
        {"noi", [](const MonthlyRow& r) { return r.noi; }},
        {"acquisition_cost", [](const MonthlyRow& r) { return r.acquisition_cost; }},
        {"leasing_costs", [](const MonthlyRow& r) { return r.leasing_costs; }},
        {"exit_proceeds", [](const MonthlyRow& r) { return r.exit_proceeds; }},
        {"unlevered_cf", [](const MonthlyRow& r) { return r.unlevered_cf; }},
        {"loan_draws", [](const MonthlyRow& r) { return r.loan_draws; }},
        {"interest", [](const MonthlyRow& r) { return r.interest; }},
        {"principal", [](const MonthlyRow& r) { return r.principal; }},
        {"debt_service", [](const MonthlyRow& r) { return r.debt_service; }},
        {"loan_fees", [](const MonthlyRow& r) { return r.loan_fees; }},
        {"loan_payoff", [](const MonthlyRow& r) { return r.loan_payoff; }},
        {"ending_loan_balance", [](const MonthlyRow& r) { return r.ending_loan_balance; }},
        {"levered_cf", [](const MonthlyRow& r) { return r.levered_cf; }},
        {"operating_levered_cf", [](const MonthlyRow& r) { return r.operating_levered_cf; }},
    };

    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("period", arrow::int32()),
        arrow::field("date", arrow::utf8())
    };
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    arrow::Int32Builder period_builder;
    arrow::StringBuilder date_builder;
    check(period_builder.Reserve(table.rows.size()), "reserve period column");
    for (const auto& r : table.rows) {
        check(period_builder.Append(r.period), "append period");
        check(date_builder.Append(r.date.to_string()), "append date");
    }
    std::shared_ptr<arrow::Array> period_array;
    check(period_builder.Finish(&period_array), "finish period array");
    std::shared_ptr<arrow::Array> date_array;
    check(date_builder.Finish(&date_array), "finish date array");
    arrays.push_back(period_array);
    arrays.push_back(date_array);

    for (const auto& [name, getter] : columns) {
        arrow::DoubleBuilder builder;
        check(builder.Reserve(table.rows.size()), std::string("reserve ") + name);
        for (const auto& r : table.rows) {
            check(builder.Append(getter(r)), std::string("append ") + name);
        }
        std::shared_ptr<arrow::Array> array;
        check(builder.Finish(&array), std::string("finish ") + name);
        fields.push_back(arrow::field(name, arrow::float64()));
        arrays.push_back(array);
    }

    auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile.status().ToString());
    }

    check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), *outfile, 1024 * 1024),
          "write Parquet table");
    check((*outfile)->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_monthly(const CashFlowTable& /* table */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace proforma
