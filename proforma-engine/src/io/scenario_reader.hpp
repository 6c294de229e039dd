#ifndef PROFORMA_IO_SCENARIO_READER_HPP
#define PROFORMA_IO_SCENARIO_READER_HPP

#include "../model.hpp"
#include <string>

namespace proforma {
namespace io {

/**
 * @brief A parsed scenario payload: model inputs plus run options
 */
struct ScenarioDocument {
    ModelInputs inputs;
    ModelConfig config;
    std::string rent_roll_path;     ///< Resolved CSV path, empty if tenants were inline
    std::string rate_curve_path;    ///< Resolved CSV path, empty if inline or absent
};

/**
 * @brief Parses a scenario payload from a JSON string
 *
 * CSV paths named in the payload (rent_roll_csv, rate_curve_csv) are
 * expanded, resolved against base_dir and loaded; they override inline
 * tenants and rate_curve.
 *
 * @throws ConfigParseError on malformed JSON, a wrong type, or a missing
 *         required field (the message names the field)
 */
ScenarioDocument parse_scenario_from_string(const std::string& json_string,
                                            const std::string& base_dir = "");

/**
 * @brief Reads and parses a scenario file; relative CSV paths resolve
 *        against the file's directory
 *
 * @throws ConfigParseError if the file cannot be read
 */
ScenarioDocument parse_scenario_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a relative path against base_dir; absolute paths and an
 *        empty base_dir return the path unchanged
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace io
} // namespace proforma

#endif // PROFORMA_IO_SCENARIO_READER_HPP
