#ifndef PROFORMA_IO_JSON_WRITER_HPP
#define PROFORMA_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../model.hpp"

namespace proforma {
namespace io {

// Write a ModelResult as JSON: summary, exit, monthly, annual and waterfall
// sections. Non-finite numbers are written as null.
void write_model_result_json(std::ostream& os, const ModelResult& result,
                             bool pretty_print = true);

void write_model_result_json(const std::string& filepath, const ModelResult& result,
                             bool pretty_print = true);

// Write a failed CalculationResponse: success, error_kind, error_message
void write_error_json(std::ostream& os, const CalculationResponse& response);

} // namespace io
} // namespace proforma

#endif // PROFORMA_IO_JSON_WRITER_HPP
