/**
 * @file logger.hpp
 * @brief Structured logging for the import calculator with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Calculation context (request ID, operation)
 * - Console (stderr) and file sinks
 *
 * Only the outer layers (CLI, batch runner, config loader) log; the tax and
 * arbitrage engines stay free of side effects.
 */

#ifndef IMPORTCALC_LOGGER_HPP
#define IMPORTCALC_LOGGER_HPP

#include "arbitrage_engine.hpp"
#include "tax_engine.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace importcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values (bracket totals, estimator details)
    INFO,    ///< Calculations completed, configuration loaded
    WARN,    ///< Non-fatal issues (failed batch items, fallbacks)
    ERROR    ///< Failures surfaced to the caller
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-sensitive, defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies the calculation a log event belongs to
 */
struct CalculationContext {
    std::string request_id;   ///< Caller reference ("" for single CLI runs)
    std::string operation;    ///< "tax", "analyze", "batch"

    CalculationContext() = default;
    CalculationContext(const std::string& id, const std::string& op)
        : request_id(id), operation(op) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("importcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   CalculationContext ctx("req-1", "analyze");
 *   logger.log_analysis_complete(ctx, result, 0.42);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Log a loaded engine configuration
     *
     * @param source Config file path, or "built-in"
     * @param config The resulting configuration
     */
    void log_config_loaded(const std::string& source, const ArbitrageConfig& config);

    /**
     * @brief Log a completed tax calculation
     */
    void log_tax_computed(const CalculationContext& ctx, const TaxResult& result);

    /**
     * @brief Log a completed arbitrage analysis
     *
     * @param ctx Calculation context
     * @param result Analysis result
     * @param execution_time_ms Wall time of the analysis
     */
    void log_analysis_complete(const CalculationContext& ctx,
                               const ArbitrageResult& result,
                               double execution_time_ms);

    /**
     * @brief Log batch completion
     */
    void log_batch_complete(const CalculationContext& ctx,
                            size_t total,
                            size_t failed,
                            double execution_time_ms);

    /**
     * @brief Log error with context
     *
     * @param ctx Calculation context
     * @param error_kind Error class ("InvalidInput", "InsufficientData", ...)
     * @param error_message Error message
     */
    void log_error(const CalculationContext& ctx,
                   const std::string& error_kind,
                   const std::string& error_message);

    void log_warning(const CalculationContext& ctx, const std::string& warning_message);

    // Free-form event
    void log_event(LogLevel level,
                   const std::string& message,
                   const std::map<std::string, std::string>& fields);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace importcalc

#endif // IMPORTCALC_LOGGER_HPP
