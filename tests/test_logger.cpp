/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace importcalc;
using json = nlohmann::json;

namespace {

// Route the logger to a fresh file
void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG, bool as_json = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = as_json;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

// Detach the file sink before removing the file
void finish(const std::string& path) {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(path);
}

ArbitrageResult golf_result() {
    ArbitrageRequest request;
    request.listing.price = 21500.0;
    request.listing.make = "Volkswagen";
    request.listing.model = "Golf";
    request.listing.vehicle = VehicleFacts(118.0, FuelCategory::Diesel, CalendarDate(2022, 3, 15));
    request.listing.vehicle.evaluation_date = CalendarDate(2026, 1, 10);
    for (double price : {27900.0, 28500.0, 27400.0, 29100.0, 45000.0}) {
        request.comparables.emplace_back(price);
    }
    return compute_arbitrage(request, ArbitrageConfig());
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "importcalc.log");
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Minimum level can be changed") {
        Logger& logger = Logger::get_instance();
        logger.set_min_level(LogLevel::WARN);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);
        logger.set_min_level(LogLevel::INFO);
    }
}

TEST_CASE("Logger config event", "[logger]") {
    const std::string path = "test_config_loaded.log";
    log_to_file(path);

    Logger::get_instance().log_config_loaded("data/engine_config.json", ArbitrageConfig());
    auto lines = read_lines(path);

    REQUIRE(lines.size() == 1);
    json fields = json::parse(lines[0]);
    REQUIRE(fields["event"] == "config_loaded");
    REQUIRE(fields["level"] == "INFO");
    REQUIRE(fields["source"] == "data/engine_config.json");
    REQUIRE(fields["schedule"] == "2026");
    REQUIRE(fields["brackets"] == "5");
    REQUIRE(fields["depreciation_steps"] == "14");
    REQUIRE(fields["surcharge_fuel"] == "diesel");
    REQUIRE(fields["default_import_costs"] == "797.95");
    REQUIRE(fields["threshold_go"] == "2500.00");
    REQUIRE(fields.contains("timestamp"));

    finish(path);
}

TEST_CASE("Logger tax event", "[logger]") {
    const std::string path = "test_tax_computed.log";
    log_to_file(path);

    TaxResult result = compute_tax_liability(118.0, FuelCategory::Diesel, 46, TaxSchedule::reference_2026());
    Logger::get_instance().log_tax_computed(CalculationContext("req-7", "tax"), result);
    auto lines = read_lines(path);

    REQUIRE(lines.size() == 1);
    json fields = json::parse(lines[0]);
    REQUIRE(fields["event"] == "tax_computed");
    REQUIRE(fields["request_id"] == "req-7");
    REQUIRE(fields["operation"] == "tax");
    REQUIRE(fields["surcharge"] == "5273.76");
    REQUIRE(fields["age_months"] == "46");
    REQUIRE(fields["payable"] == "2294.47");

    finish(path);
}

TEST_CASE("Logger analysis event reports excluded outliers", "[logger]") {
    const std::string path = "test_analysis.log";
    log_to_file(path);

    Logger::get_instance().log_analysis_complete(CalculationContext("golf", "analyze"), golf_result(), 0.25);
    auto lines = read_lines(path);

    REQUIRE(lines.size() == 2);
    json complete = json::parse(lines[0]);
    REQUIRE(complete["event"] == "analysis_complete");
    REQUIRE(complete["recommendation"] == "GO");
    REQUIRE(complete["market_value"] == "28225.00");
    REQUIRE(complete["margin"] == "3632.58");
    REQUIRE(complete["comparables_retained"] == "4");

    json detail = json::parse(lines[1]);
    REQUIRE(detail["event"] == "outliers_excluded");
    REQUIRE(detail["level"] == "DEBUG");

    finish(path);
}

TEST_CASE("Logger level filtering", "[logger]") {
    const std::string path = "test_filtering.log";
    log_to_file(path, LogLevel::WARN);

    Logger& logger = Logger::get_instance();
    logger.log_analysis_complete(CalculationContext("golf", "analyze"), golf_result(), 0.25);
    logger.log_batch_complete(CalculationContext("", "batch"), 3, 0, 1.0);
    logger.log_batch_complete(CalculationContext("", "batch"), 3, 1, 1.0);
    logger.log_error(CalculationContext("a4", "batch"), "InsufficientData", "No comparables");
    auto lines = read_lines(path);

    REQUIRE(lines.size() == 2);
    json batch = json::parse(lines[0]);
    REQUIRE(batch["event"] == "batch_complete");
    REQUIRE(batch["level"] == "WARN");
    REQUIRE(batch["failed"] == "1");

    json error = json::parse(lines[1]);
    REQUIRE(error["level"] == "ERROR");
    REQUIRE(error["error_kind"] == "InsufficientData");
    REQUIRE(error["error_message"] == "No comparables");
    REQUIRE(error["request_id"] == "a4");

    finish(path);
}

TEST_CASE("Logger escapes JSON strings", "[logger]") {
    const std::string path = "test_escaping.log";
    log_to_file(path);

    Logger::get_instance().log_warning(CalculationContext("q\"uote", "analyze"), "line\nbreak \\ tab\t");
    auto lines = read_lines(path);

    REQUIRE(lines.size() == 1);
    json fields = json::parse(lines[0]);
    REQUIRE(fields["request_id"] == "q\"uote");
    REQUIRE(fields["warning"] == "line\nbreak \\ tab\t");

    finish(path);
}

TEST_CASE("Logger plain text output", "[logger]") {
    const std::string path = "test_plain.log";
    log_to_file(path, LogLevel::INFO, false);

    Logger::get_instance().log_event(LogLevel::INFO, "Custom event", {{"key", "value"}});
    auto lines = read_lines(path);

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Custom event") != std::string::npos);
    REQUIRE(lines[0].find("{key=value}") != std::string::npos);

    finish(path);
}
