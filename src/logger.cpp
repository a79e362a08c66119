/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace importcalc {

namespace {

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_config_loaded(const std::string& source, const ArbitrageConfig& config) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["source"] = source;
    fields["schedule"] = config.schedule.label();
    fields["brackets"] = std::to_string(config.schedule.brackets().size());
    fields["depreciation_steps"] = std::to_string(config.schedule.depreciation().size());
    fields["surcharge_fuel"] = fuel_category_to_string(config.schedule.surcharge().fuel);
    fields["default_import_costs"] = format_amount(config.default_costs.total());
    fields["threshold_go"] = format_amount(config.thresholds.go);
    fields["threshold_consider"] = format_amount(config.thresholds.consider);

    log(LogLevel::INFO, "Configuration loaded", fields);
}

void Logger::log_tax_computed(const CalculationContext& ctx, const TaxResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "tax_computed";
    fields["request_id"] = ctx.request_id;
    fields["operation"] = ctx.operation;
    fields["gross"] = format_amount(result.gross_amount);
    fields["surcharge"] = format_amount(result.surcharge);
    fields["total_gross"] = format_amount(result.total_gross);
    fields["age_months"] = std::to_string(result.vehicle_age_months);
    fields["depreciation_pct"] = format_amount(result.depreciation_percentage);
    fields["payable"] = format_amount(result.payable);

    log(LogLevel::INFO, "Tax computed", fields);
}

void Logger::log_analysis_complete(const CalculationContext& ctx,
                                   const ArbitrageResult& result,
                                   double execution_time_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_complete";
    fields["request_id"] = ctx.request_id;
    fields["operation"] = ctx.operation;
    fields["vehicle"] = result.vehicle_description;
    fields["listing_price"] = format_amount(result.listing_price);
    fields["market_value"] = format_amount(result.market_value);
    fields["market_value_method"] = result.market_value_method;
    fields["comparables"] = std::to_string(result.comparables_count);
    fields["comparables_retained"] = std::to_string(result.comparables_retained);
    fields["total_cost"] = format_amount(result.costs.total_cost);
    fields["margin"] = format_amount(result.margin);
    fields["recommendation"] = recommendation_to_string(result.recommendation);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(LogLevel::INFO, "Analysis completed", fields);

    if (result.comparables_retained < result.comparables_count) {
        std::map<std::string, std::string> detail;
        detail["event"] = "outliers_excluded";
        detail["request_id"] = ctx.request_id;
        detail["excluded"] = std::to_string(result.comparables_count - result.comparables_retained);
        log(LogLevel::DEBUG, "Comparables excluded as outliers", detail);
    }
}

void Logger::log_batch_complete(const CalculationContext& ctx,
                                size_t total,
                                size_t failed,
                                double execution_time_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_complete";
    fields["request_id"] = ctx.request_id;
    fields["operation"] = ctx.operation;
    fields["requests"] = std::to_string(total);
    fields["failed"] = std::to_string(failed);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(failed > 0 ? LogLevel::WARN : LogLevel::INFO, "Batch completed", fields);
}

void Logger::log_error(const CalculationContext& ctx,
                       const std::string& error_kind,
                       const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["request_id"] = ctx.request_id;
    fields["operation"] = ctx.operation;
    fields["error_kind"] = error_kind;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Calculation error", fields);
}

void Logger::log_warning(const CalculationContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["request_id"] = ctx.request_id;
    fields["operation"] = ctx.operation;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_event(LogLevel level,
                       const std::string& message,
                       const std::map<std::string, std::string>& fields) {
    log(level, message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::map<std::string, std::string>& fields) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace importcalc
