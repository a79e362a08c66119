#include "engine_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace importcalc {

EngineConfig::EngineConfig()
    : arbitrage(), logging(), source("built-in") {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference, keep literally
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (name_end == name_start) {
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute() || config_file_path.empty()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

std::string resolve_table_source(const std::string& source, const std::string& config_file_path) {
    std::string expanded = expand_environment_variables(source);
    const std::string local_prefix = "local://";

    if (expanded.rfind(local_prefix, 0) == 0) {
        return resolve_relative_path(expanded.substr(local_prefix.size()), config_file_path);
    }
    if (expanded.find("://") != std::string::npos) {
        throw ConfigParseError("Unsupported table source '" + expanded + "'. Use local:// paths.");
    }
    return resolve_relative_path(expanded, config_file_path);
}

// ============================================================================
// Section parsers
// ============================================================================

namespace {

double number_field(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key)) {
        throw ConfigParseError(where + " missing required field: " + key);
    }
    const json& v = obj.at(key);
    if (!v.is_number()) {
        throw ConfigParseError(where + " field '" + key + "' must be a number");
    }
    return v.get<double>();
}

// null, "inf" or a missing key mean unbounded
double bound_field(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key) || obj.at(key).is_null()) {
        return UNBOUNDED;
    }
    const json& v = obj.at(key);
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        if (s == "inf" || s == "infinity" || s == "Infinity") {
            return UNBOUNDED;
        }
        throw ConfigParseError(where + " field '" + key + "' must be a number, null or \"inf\"");
    }
    return number_field(obj, key, where);
}

BracketTable parse_brackets(const json& j, const std::string& config_file_path) {
    if (j.is_string()) {
        return BracketTable::load_from_csv(resolve_table_source(j.get<std::string>(), config_file_path));
    }
    if (!j.is_array()) {
        throw ConfigParseError("schedule.brackets must be a table reference or an array");
    }

    std::vector<TaxBracket> brackets;
    for (size_t i = 0; i < j.size(); ++i) {
        const json& b = j[i];
        std::string where = "schedule.brackets[" + std::to_string(i) + "]";
        double base = b.contains("base") ? number_field(b, "base", where) : 0.0;
        brackets.emplace_back(number_field(b, "min", where),
                              bound_field(b, "max", where),
                              number_field(b, "rate", where),
                              base);
    }
    return BracketTable(std::move(brackets));
}

DepreciationTable parse_depreciation(const json& j, const std::string& config_file_path) {
    if (j.is_string()) {
        return DepreciationTable::load_from_csv(resolve_table_source(j.get<std::string>(), config_file_path));
    }
    if (!j.is_array()) {
        throw ConfigParseError("schedule.depreciation must be a table reference or an array");
    }

    std::vector<DepreciationStep> steps;
    for (size_t i = 0; i < j.size(); ++i) {
        const json& s = j[i];
        std::string where = "schedule.depreciation[" + std::to_string(i) + "]";
        steps.emplace_back(bound_field(s, "max_months", where),
                           number_field(s, "percentage", where));
    }
    return DepreciationTable(std::move(steps));
}

SurchargeRule parse_surcharge(const json& j) {
    SurchargeRule rule = SurchargeRule::reference_2026();
    if (j.contains("fuel_type")) {
        try {
            rule.fuel = parse_fuel_category(j["fuel_type"].get<std::string>());
        } catch (const InvalidInput& e) {
            throw ConfigParseError(std::string("schedule.surcharge: ") + e.what());
        }
    }
    if (j.contains("threshold")) {
        rule.threshold_gkm = number_field(j, "threshold", "schedule.surcharge");
    }
    if (j.contains("rate")) {
        rule.rate_per_gram = number_field(j, "rate", "schedule.surcharge");
    }
    return rule;
}

TaxSchedule parse_schedule(const json& j, const std::string& config_file_path) {
    TaxSchedule reference = TaxSchedule::reference_2026();
    bool custom_tables = j.contains("brackets") || j.contains("depreciation") || j.contains("surcharge");

    std::string label = custom_tables ? "custom" : reference.label();
    if (j.contains("label")) {
        label = expand_environment_variables(j["label"].get<std::string>());
    }

    BracketTable brackets = j.contains("brackets")
        ? parse_brackets(j["brackets"], config_file_path)
        : reference.brackets();
    DepreciationTable depreciation = j.contains("depreciation")
        ? parse_depreciation(j["depreciation"], config_file_path)
        : reference.depreciation();
    SurchargeRule surcharge = j.contains("surcharge")
        ? parse_surcharge(j["surcharge"])
        : reference.surcharge();

    return TaxSchedule(label, std::move(brackets), std::move(depreciation), surcharge);
}

ImportCosts parse_import_costs(const json& j, const std::string& config_file_path) {
    if (j.is_string()) {
        std::string path = resolve_table_source(j.get<std::string>(), config_file_path);
        try {
            return ImportCosts::load_from_csv(path);
        } catch (const InvalidInput& e) {
            throw ConfigParseError(path + ": " + e.what());
        }
    }
    if (!j.is_object()) {
        throw ConfigParseError("import_costs must be a table reference or an object");
    }

    ImportCosts costs;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw ConfigParseError("import_costs." + it.key() + " must be a number");
        }
        try {
            costs.set(it.key(), it.value().get<double>());
        } catch (const InvalidInput& e) {
            throw ConfigParseError(std::string("import_costs: ") + e.what());
        }
    }
    return costs;
}

RecommendationThresholds parse_thresholds(const json& j) {
    RecommendationThresholds thresholds;
    if (j.contains("go")) {
        thresholds.go = number_field(j, "go", "thresholds");
    }
    if (j.contains("consider")) {
        thresholds.consider = number_field(j, "consider", "thresholds");
    }
    try {
        thresholds.validate();
    } catch (const InvalidInput& e) {
        throw ConfigParseError(std::string("thresholds: ") + e.what());
    }
    return thresholds;
}

LoggerConfig parse_logging(const json& j, const std::string& config_file_path) {
    LoggerConfig logging;
    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("logging.level must be one of DEBUG, INFO, WARN, ERROR");
        }
        logging.min_level = string_to_level(level);
    }
    if (j.contains("json")) {
        logging.enable_json = j["json"].get<bool>();
    }
    if (j.contains("console")) {
        logging.enable_console = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path = resolve_relative_path(
            expand_environment_variables(j["file"].get<std::string>()), config_file_path);
    }
    return logging;
}

} // anonymous namespace

// ============================================================================
// Entry points
// ============================================================================

EngineConfig parse_engine_config_from_string(const std::string& json_string,
                                             const std::string& config_file_path) {
    EngineConfig config;
    if (!config_file_path.empty()) {
        config.source = config_file_path;
    }

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Engine config must be a JSON object");
        }

        TaxSchedule schedule = j.contains("schedule")
            ? parse_schedule(j["schedule"], config_file_path)
            : TaxSchedule::reference_2026();
        ImportCosts costs = j.contains("import_costs")
            ? parse_import_costs(j["import_costs"], config_file_path)
            : ImportCosts();
        RecommendationThresholds thresholds = j.contains("thresholds")
            ? parse_thresholds(j["thresholds"])
            : RecommendationThresholds();

        try {
            config.arbitrage = ArbitrageConfig(std::move(schedule), costs, thresholds);
        } catch (const InvalidInput& e) {
            throw ConfigParseError(std::string("Invalid engine config: ") + e.what());
        }

        if (j.contains("logging")) {
            config.logging = parse_logging(j["logging"], config_file_path);
        }
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_engine_config_from_string(buffer.str(), file_path);
}

} // namespace importcalc
