#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace {

const std::string BINARY = std::string("\"") + IMPORTCALC_BINARY + "\"";
const std::string DATA_DIR = IMPORTCALC_DATA_DIR;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/importcalc_test_stdout.txt";
    std::string stderr_file = "/tmp/importcalc_test_stderr.txt";

    std::string full_cmd = BINARY + " " + args + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns a wait status)
    result.exit_code = WEXITSTATUS(status);
    return result;
}

std::string write_temp(const std::string& name, const std::string& content) {
    std::string path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream file(path);
    file << content;
    return path;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Usage
// ============================================================================

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
    REQUIRE(contains(result.stderr_output, "--co2"));
    REQUIRE(contains(result.stderr_output, "--comparables"));
    REQUIRE(contains(result.stderr_output, "--requests"));
    REQUIRE(contains(result.stderr_output, "--config"));
}

TEST_CASE("CLI no args shows usage and fails", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 1);
    REQUIRE(contains(result.stderr_output, "Usage:"));
}

TEST_CASE("CLI argument errors", "[cli][error]") {
    SECTION("Unknown command") {
        auto result = run_command("convert");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Unknown command"));
    }

    SECTION("Missing tax options") {
        auto result = run_command("tax --co2 118");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--fuel is required"));
        REQUIRE(contains(result.stderr_output, "--registered is required"));
    }

    SECTION("Non-numeric emission") {
        auto result = run_command("tax --co2 118g --fuel diesel --registered 2022-03-15");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--co2 expects a number"));
    }

    SECTION("Unknown fuel label") {
        auto result = run_command("tax --co2 118 --fuel steam --registered 2022-03-15");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Unrecognized fuel type"));
    }

    SECTION("Malformed registration date") {
        auto result = run_command("tax --co2 118 --fuel diesel --registered 2022-13-01");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Negative emission is a calculation error, not a usage error") {
        auto result = run_command("tax --co2 -5 --fuel diesel --registered 2022-03-15 --date 2026-01-10");
        REQUIRE(result.exit_code == 2);
    }

    SECTION("Missing request file") {
        auto result = run_command("analyze --request /nonexistent/request.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Request file not found"));
    }

    SECTION("Bad format") {
        auto result = run_command("analyze --request " + DATA_DIR + "/sample_request.json --format xml");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--format must be json or text"));
    }
}

// ============================================================================
// tax
// ============================================================================

TEST_CASE("CLI tax command", "[cli][tax]") {
    auto result = run_command("tax --co2 118 --fuel Diesel --registered 2022-03-15 --date 2026-01-10");
    REQUIRE(result.exit_code == 0);

    json doc = json::parse(result.stdout_output);
    REQUIRE(doc["tax"]["vehicle_age_months"] == 46);
    REQUIRE(doc["tax"]["payable"].get<double>() == 2294.47);
}

TEST_CASE("CLI tax text report", "[cli][tax]") {
    auto result = run_command("tax --co2 0 --fuel elektrisch --registered 2024-01-01 --date 2026-01-01 --format text");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stdout_output, "BPM CALCULATION"));
    REQUIRE(contains(result.stdout_output, "EUR 340.17"));
}

TEST_CASE("CLI tax rejects a future registration", "[cli][tax][error]") {
    auto result = run_command("tax --co2 100 --fuel petrol --registered 2026-05-01 --date 2026-01-01");
    REQUIRE(result.exit_code == 2);
    REQUIRE(contains(result.stderr_output, "precedes first registration"));
}

// ============================================================================
// analyze
// ============================================================================

TEST_CASE("CLI analyze command", "[cli][analyze]") {
    auto result = run_command("analyze --config " + DATA_DIR + "/engine_config.json --request " +
                              DATA_DIR + "/sample_request.json");
    REQUIRE(result.exit_code == 0);

    json doc = json::parse(result.stdout_output);
    REQUIRE(doc["request_id"] == "golf-2022-001");
    REQUIRE(doc["market_value"].get<double>() == 28225.0);
    REQUIRE(doc["margin"].get<double>() == 3632.58);
    REQUIRE(doc["recommendation"] == "GO");
}

TEST_CASE("CLI analyze with CSV comparables and text output", "[cli][analyze]") {
    std::string output = (std::filesystem::temp_directory_path() / "importcalc_report.txt").string();
    std::filesystem::remove(output);

    auto result = run_command("analyze --request " + DATA_DIR + "/sample_request.json --comparables " +
                              DATA_DIR + "/sample_comparables.csv --format text --output " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Output written to:"));

    std::string report = read_file(output);
    REQUIRE(contains(report, "RESULT: GO"));
    REQUIRE(contains(report, "EUR 28,225.00"));

    std::filesystem::remove(output);
}

TEST_CASE("CLI analyze without comparables", "[cli][analyze][error]") {
    std::string request = write_temp("importcalc_no_comps.json", R"({
        "listing": {"price": 20000, "co2_gkm": 120, "fuel_type": "petrol",
                    "first_registration": "2021-01-01", "evaluation_date": "2026-01-01"},
        "comparables": []
    })");

    auto result = run_command("analyze --request " + request + " --log-level ERROR");
    REQUIRE(result.exit_code == 2);
    REQUIRE(contains(result.stderr_output, "InsufficientData"));

    std::filesystem::remove(request);
}

TEST_CASE("CLI analyze with a malformed request", "[cli][analyze][error]") {
    std::string request = write_temp("importcalc_bad_request.json", "{\"listing\": ");

    auto result = run_command("analyze --request " + request);
    REQUIRE(result.exit_code == 1);
    REQUIRE(contains(result.stderr_output, "JSON parse error"));

    std::filesystem::remove(request);
}

// ============================================================================
// batch
// ============================================================================

TEST_CASE("CLI batch command", "[cli][batch]") {
    std::string output = (std::filesystem::temp_directory_path() / "importcalc_batch.json").string();
    std::filesystem::remove(output);

    auto result = run_command("batch --requests " + DATA_DIR + "/sample_batch.json --output " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Succeeded: 2"));
    REQUIRE(contains(result.stderr_output, "Failed:    1"));

    std::ifstream file(output);
    json doc = json::parse(file);
    REQUIRE(doc["summary"]["requests"] == 3);
    REQUIRE(doc["summary"]["go"] == 1);
    REQUIRE(doc["summary"]["consider"] == 1);
    REQUIRE(doc["results"][2]["error_kind"] == "InsufficientData");
    file.close();

    std::filesystem::remove(output);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("CLI rejects an invalid config", "[cli][config][error]") {
    SECTION("Malformed JSON") {
        std::string config = write_temp("importcalc_bad_config.json", "{ nope");
        auto result = run_command("tax --co2 100 --fuel petrol --registered 2022-01-01 --config " + config);
        REQUIRE(result.exit_code == 3);
        std::filesystem::remove(config);
    }

    SECTION("Broken schedule") {
        std::string config = write_temp("importcalc_bad_schedule.json",
                                        R"({"schedule": {"depreciation": [{"max_months": 12, "percentage": 10}]}})");
        auto result = run_command("tax --co2 100 --fuel petrol --registered 2022-01-01 --config " + config);
        REQUIRE(result.exit_code == 3);
        REQUIRE(contains(result.stderr_output, "Invalid tax schedule"));
        std::filesystem::remove(config);
    }

    SECTION("Missing config file") {
        auto result = run_command("tax --co2 100 --fuel petrol --registered 2022-01-01 --config /nonexistent.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Config file not found"));
    }
}

TEST_CASE("CLI custom thresholds from config", "[cli][config]") {
    std::string config = write_temp("importcalc_strict.json", R"({"thresholds": {"go": 5000, "consider": 4000}})");

    auto result = run_command("analyze --config " + config + " --request " + DATA_DIR + "/sample_request.json");
    REQUIRE(result.exit_code == 0);
    REQUIRE(json::parse(result.stdout_output)["recommendation"] == "NO_GO");

    std::filesystem::remove(config);
}
