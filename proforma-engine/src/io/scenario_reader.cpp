#include "scenario_reader.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace proforma {
namespace io {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated ${ in: " + value);
            }
            pos++;
        }
        if (var_name.empty()) {
            // A lone '$' stays literal
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);
    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (fs::path(base_dir) / p).string();
}

namespace {

// Required field lookup; the message names the full field path
const json& require(const json& j, const char* key, const std::string& context) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigParseError("Missing required field: " + context + key);
    }
    return j.at(key);
}

template <typename T>
T optional_value(const json& j, const char* key, T fallback) {
    if (j.is_object() && j.contains(key) && !j.at(key).is_null()) {
        return j.at(key).get<T>();
    }
    return fallback;
}

std::vector<ScheduledAmount> parse_schedule(const json& j, const std::string& context) {
    std::vector<ScheduledAmount> out;
    if (!j.is_array()) {
        throw ConfigParseError("Field " + context + " must be an array");
    }
    for (const auto& item : j) {
        ScheduledAmount a;
        a.period = require(item, "period", context + "[].").get<int>();
        a.amount = require(item, "amount", context + "[].").get<double>();
        out.push_back(a);
    }
    return out;
}

Tenant parse_tenant(const json& j) {
    Tenant t;
    t.id = require(j, "id", "tenants[].").get<std::string>();
    const std::string ctx = "tenants[" + t.id + "].";
    t.area = require(j, "area", ctx).get<double>();
    t.in_place_rent = require(j, "in_place_rent", ctx).get<double>();
    t.market_rent = require(j, "market_rent", ctx).get<double>();
    t.lease_end_month = require(j, "lease_end_month", ctx).get<int>();
    t.lease_start_month = optional_value(j, "lease_start_month", 0);
    t.rollover_costs = optional_value(j, "rollover_costs", false);
    t.ti_buildout_months = optional_value(j, "ti_buildout_months", 0);
    t.free_rent_months = optional_value(j, "free_rent_months", 0);
    if (j.contains("rent_bump_rate") && !j.at("rent_bump_rate").is_null()) {
        t.rent_bump_rate = j.at("rent_bump_rate").get<double>();
    }
    t.ti_allowance_per_area = optional_value(j, "ti_allowance_per_area", 0.0);
    t.lc_rate_years_1_5 = optional_value(j, "lc_rate_years_1_5", 0.0);
    t.lc_rate_years_6_plus = optional_value(j, "lc_rate_years_6_plus", 0.0);
    t.new_lease_term_years = optional_value(j, "new_lease_term_years", 10);
    return t;
}

Loan parse_loan(const json& j, size_t index) {
    Loan loan;
    loan.id = optional_value<std::string>(j, "id", "loan" + std::to_string(index + 1));
    const std::string ctx = "loans[" + loan.id + "].";

    if (j.contains("ltc")) {
        loan.ltc = j.at("ltc").get<double>();
    } else {
        loan.principal = require(j, "principal", ctx).get<double>();
    }

    const std::string mode = optional_value<std::string>(j, "rate_mode", "fixed");
    if (mode == "fixed") {
        loan.rate_mode = RateMode::Fixed;
        loan.fixed_rate = require(j, "rate", ctx).get<double>();
    } else if (mode == "floating") {
        loan.rate_mode = RateMode::Floating;
        loan.spread = require(j, "spread", ctx).get<double>();
    } else {
        throw ConfigParseError("Field " + ctx + "rate_mode must be 'fixed' or 'floating', got '" + mode + "'");
    }

    const std::string day_count = optional_value<std::string>(j, "day_count", "actual/365");
    if (day_count == "actual/365") {
        loan.day_count = DayCount::Actual365;
    } else if (day_count == "monthly") {
        loan.day_count = DayCount::Monthly;
    } else {
        throw ConfigParseError("Field " + ctx + "day_count must be 'actual/365' or 'monthly'");
    }

    loan.io_months = optional_value(j, "io_months", 0);
    loan.amortization_months = optional_value(j, "amortization_months", 360);
    loan.origination_fee_rate = optional_value(j, "origination_fee_rate", 0.0);
    loan.closing_cost_rate = optional_value(j, "closing_cost_rate", 0.0);
    if (j.contains("draws")) {
        loan.draws = parse_schedule(j.at("draws"), ctx + "draws");
    }
    if (j.contains("prepayments")) {
        loan.prepayments = parse_schedule(j.at("prepayments"), ctx + "prepayments");
    }
    return loan;
}

WaterfallTier parse_tier(const json& j, const std::string& default_name) {
    WaterfallTier tier;
    tier.name = optional_value<std::string>(j, "name", default_name);
    const std::string ctx = "waterfall." + tier.name + ".";
    tier.pref_rate = optional_value(j, "pref_rate", 0.0);
    tier.lp_split = require(j, "lp_split", ctx).get<double>();
    tier.gp_split = require(j, "gp_split", ctx).get<double>();
    tier.promote = optional_value(j, "promote", 0.0);
    return tier;
}

void parse_scenario_parameters(const json& j, ScenarioParameters& s) {
    s.scenario_id = optional_value<std::string>(j, "scenario_id", s.scenario_id);
    s.acquisition_date = Date::parse(require(j, "acquisition_date", "").get<std::string>());
    s.hold_months = require(j, "hold_months", "").get<int>();
    s.purchase_price = require(j, "purchase_price", "").get<double>();
    s.closing_costs = optional_value(j, "closing_costs", 0.0);
    s.building_area = require(j, "building_area", "").get<double>();
    s.vacancy_rate = optional_value(j, "vacancy_rate", 0.0);
    s.collection_loss_rate = optional_value(j, "collection_loss_rate", 0.0);
    s.management_fee_rate = optional_value(j, "management_fee_rate", 0.0);
    s.fixed_opex_per_area = optional_value(j, "fixed_opex_per_area", 0.0);
    s.variable_opex_per_area = optional_value(j, "variable_opex_per_area", 0.0);
    s.capital_reserve_per_area = optional_value(j, "capital_reserve_per_area", 0.0);
    s.nnn_lease = optional_value(j, "nnn_lease", true);
    s.money_scale = optional_value(j, "money_scale", 1000.0);

    if (j.contains("escalation")) {
        const json& e = j.at("escalation");
        s.escalation.rent_growth = optional_value(e, "rent_growth", 0.0);
        s.escalation.expense_growth = optional_value(e, "expense_growth", 0.0);
        if (e.contains("post_stabilization_rent_growth") && !e.at("post_stabilization_rent_growth").is_null()) {
            s.escalation.post_stabilization_rent_growth = e.at("post_stabilization_rent_growth").get<double>();
        }
        s.escalation.stabilization_month = optional_value(e, "stabilization_month", 0);
    }

    if (j.contains("property_tax")) {
        const json& t = j.at("property_tax");
        s.property_tax.annual_base = require(t, "annual_base", "property_tax.").get<double>();
        s.property_tax.growth = optional_value(t, "growth", 0.0);
        s.property_tax.start_month = optional_value(t, "start_month", 1);
    }

    const json& exit = require(j, "exit", "");
    s.exit_cap_rate = require(exit, "cap_rate", "exit.").get<double>();
    s.sales_cost_rate = optional_value(exit, "sales_cost_rate", 0.0);

    if (j.contains("ancillary")) {
        const json& a = j.at("ancillary");
        s.ancillary.parking_stalls = optional_value(a, "parking_stalls", 0.0);
        s.ancillary.parking_rate_per_stall = optional_value(a, "parking_rate_per_stall", 0.0);
        s.ancillary.storage_units = optional_value(a, "storage_units", 0.0);
        s.ancillary.storage_rate_per_unit = optional_value(a, "storage_rate_per_unit", 0.0);
        s.ancillary.parking_expense_rate = optional_value(a, "parking_expense_rate", 0.0);
    }
}

} // anonymous namespace

ScenarioDocument parse_scenario_from_string(const std::string& json_string, const std::string& base_dir) {
    ScenarioDocument doc;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Scenario payload must be a JSON object");
        }

        parse_scenario_parameters(j, doc.inputs.scenario);

        if (j.contains("rent_roll_csv")) {
            doc.rent_roll_path = resolve_relative_path(
                expand_environment_variables(j.at("rent_roll_csv").get<std::string>()), base_dir);
        } else if (j.contains("tenants")) {
            // Absent tenants may still arrive as a CSV from the caller
            for (const auto& tj : j.at("tenants")) {
                doc.inputs.tenants.add(parse_tenant(tj));
            }
        }

        if (j.contains("loans")) {
            size_t index = 0;
            for (const auto& lj : j.at("loans")) {
                doc.inputs.loans.push_back(parse_loan(lj, index++));
            }
        }

        if (j.contains("rate_curve_csv")) {
            doc.rate_curve_path = resolve_relative_path(
                expand_environment_variables(j.at("rate_curve_csv").get<std::string>()), base_dir);
        } else if (j.contains("rate_curve")) {
            for (const auto& pj : j.at("rate_curve")) {
                doc.inputs.rate_curve.add(
                    Date::parse(require(pj, "date", "rate_curve[].").get<std::string>()),
                    require(pj, "rate", "rate_curve[].").get<double>());
            }
        }

        if (j.contains("waterfall")) {
            const json& w = j.at("waterfall");
            WaterfallConfig& wf = doc.inputs.waterfall;
            wf.lp_share = optional_value(w, "lp_share", wf.lp_share);
            wf.gp_share = optional_value(w, "gp_share", wf.gp_share);
            wf.compound_monthly = optional_value(w, "compound_monthly", wf.compound_monthly);
            if (w.contains("tiers")) {
                wf.tiers.clear();
                for (const auto& tj : w.at("tiers")) {
                    wf.tiers.push_back(parse_tier(tj, "Hurdle " + std::to_string(wf.tiers.size() + 1)));
                }
            }
            if (w.contains("final_split")) {
                wf.final_split = parse_tier(w.at("final_split"), "Final Split");
            }
        }

        if (j.contains("options")) {
            const json& o = j.at("options");
            doc.config.resolve_circular = optional_value(o, "resolve_circular", doc.config.resolve_circular);
            doc.config.discount_rate = optional_value(o, "discount_rate", doc.config.discount_rate);
            doc.config.solver.initial_guess = optional_value(o, "irr_guess", doc.config.solver.initial_guess);
            doc.config.include_waterfall = optional_value(o, "waterfall", doc.config.include_waterfall);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON field error: ") + e.what());
    }

    // CSV files override inline data
    if (!doc.rent_roll_path.empty()) {
        doc.inputs.tenants = TenantSet::load_from_csv(doc.rent_roll_path);
    }
    if (!doc.rate_curve_path.empty()) {
        doc.inputs.rate_curve = RateCurve::load_from_csv(doc.rate_curve_path);
    }

    return doc;
}

ScenarioDocument parse_scenario_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open scenario file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_scenario_from_string(buffer.str(), fs::path(file_path).parent_path().string());
}

} // namespace io
} // namespace proforma
