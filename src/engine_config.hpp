#ifndef IMPORTCALC_ENGINE_CONFIG_HPP
#define IMPORTCALC_ENGINE_CONFIG_HPP

#include "arbitrage_engine.hpp"
#include "logger.hpp"
#include <string>

namespace importcalc {

/**
 * @brief Everything the CLI needs to run: calculation config plus logging
 */
struct EngineConfig {
    ArbitrageConfig arbitrage;
    LoggerConfig logging;
    std::string source;   ///< Config file path, or "built-in"

    EngineConfig();
};

/**
 * @brief Expand ${VAR} and $VAR environment references
 *
 * Unset variables expand to the empty string. A '$' not followed by a
 * variable name is kept as is.
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolve a path relative to the directory of a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

/**
 * @brief Turn a table reference ("local://file.csv" or a plain path) into a filesystem path
 *
 * @throws ConfigParseError for any other scheme
 */
std::string resolve_table_source(const std::string& source, const std::string& config_file_path);

/**
 * @brief Parse an engine configuration from a JSON string
 *
 * Omitted sections fall back to the 2026 reference schedule, default import
 * costs and default thresholds.
 *
 * @param json_string JSON document
 * @param config_file_path Path the document was read from; relative table
 *        references resolve against its directory (empty = working directory)
 * @throws ConfigParseError on malformed JSON or invalid values
 * @throws ScheduleError if a loaded table violates its invariants
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string,
                                             const std::string& config_file_path = "");

/**
 * @brief Parse an engine configuration from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or parsed
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

} // namespace importcalc

#endif // IMPORTCALC_ENGINE_CONFIG_HPP
