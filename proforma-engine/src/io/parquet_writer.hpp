#ifndef PROFORMA_IO_PARQUET_WRITER_HPP
#define PROFORMA_IO_PARQUET_WRITER_HPP

#include "../cashflow.hpp"
#include <string>

namespace proforma {
namespace io {

class ParquetWriter {
public:
    /**
     * Write the monthly cash-flow table to a Parquet file.
     *
     * Output schema:
     *   - period: int32
     *   - date: utf8 (YYYY-MM-DD)
     *   - one float64 column per monetary line (potential_revenue,
     *     effective_revenue, total_expenses, noi, leasing_costs,
     *     exit_proceeds, unlevered_cf, interest, principal, debt_service,
     *     loan_fees, loan_payoff, levered_cf)
     *
     * @param table Assembled cash flows
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or when
     *         built without Apache Arrow
     */
    static void write_monthly(const CashFlowTable& table, const std::string& filepath);

    static bool available();
};

} // namespace io
} // namespace proforma

#endif // PROFORMA_IO_PARQUET_WRITER_HPP
