#include "request_parser.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace importcalc {
namespace io {

namespace {

double require_number(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key)) {
        throw InvalidInput(where + " missing required field: " + key);
    }
    if (!obj.at(key).is_number()) {
        throw InvalidInput(where + " field '" + key + "' must be a number");
    }
    return obj.at(key).get<double>();
}

std::string require_string(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key)) {
        throw InvalidInput(where + " missing required field: " + key);
    }
    if (!obj.at(key).is_string()) {
        throw InvalidInput(where + " field '" + key + "' must be a string");
    }
    return obj.at(key).get<std::string>();
}

std::string optional_string(const json& obj, const std::string& key) {
    if (obj.contains(key) && obj.at(key).is_string()) {
        return obj.at(key).get<std::string>();
    }
    return "";
}

Listing parse_listing(const json& j) {
    if (!j.is_object()) {
        throw InvalidInput("listing must be an object");
    }

    Listing listing;
    listing.price = require_number(j, "price", "listing");
    listing.vehicle.co2_gkm = require_number(j, "co2_gkm", "listing");
    listing.vehicle.fuel = parse_fuel_category(require_string(j, "fuel_type", "listing"));
    listing.vehicle.first_registration =
        CalendarDate::parse(require_string(j, "first_registration", "listing"));

    if (j.contains("evaluation_date") && !j["evaluation_date"].is_null()) {
        listing.vehicle.evaluation_date =
            CalendarDate::parse(require_string(j, "evaluation_date", "listing"));
    }
    if (j.contains("mileage_km")) {
        listing.mileage_km = require_number(j, "mileage_km", "listing");
    }
    listing.make = optional_string(j, "make");
    listing.model = optional_string(j, "model");
    listing.source = optional_string(j, "source");
    if (j.contains("year")) {
        double year = require_number(j, "year", "listing");
        if (!std::isfinite(year) || year != std::floor(year) || year < 1886.0 || year > 9999.0) {
            throw InvalidInput("listing field 'year' must be a whole year between 1886 and 9999");
        }
        listing.year = static_cast<int>(year);
    }

    return listing;
}

// Accepts bare prices or {"price", "mileage_km", "source"} objects
std::vector<Comparable> parse_comparables(const json& j) {
    if (!j.is_array()) {
        throw InvalidInput("comparables must be an array");
    }

    std::vector<Comparable> comparables;
    comparables.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const json& c = j[i];
        if (c.is_number()) {
            comparables.emplace_back(c.get<double>());
            continue;
        }
        std::string where = "comparables[" + std::to_string(i) + "]";
        if (!c.is_object()) {
            throw InvalidInput(where + " must be a number or an object");
        }
        double mileage = c.contains("mileage_km") ? require_number(c, "mileage_km", where) : 0.0;
        comparables.emplace_back(require_number(c, "price", where), mileage, optional_string(c, "source"));
    }
    return comparables;
}

ImportCostOverrides parse_cost_overrides(const json& j) {
    if (!j.is_object()) {
        throw InvalidInput("import_costs must be an object");
    }

    ImportCostOverrides overrides;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw InvalidInput("import_costs." + it.key() + " must be a number");
        }
        overrides.set(it.key(), it.value().get<double>());
    }
    return overrides;
}

RecommendationThresholds parse_thresholds(const json& j) {
    if (!j.is_object()) {
        throw InvalidInput("thresholds must be an object");
    }
    RecommendationThresholds thresholds(require_number(j, "go", "thresholds"),
                                        require_number(j, "consider", "thresholds"));
    thresholds.validate();
    return thresholds;
}

ArbitrageRequest parse_request(const json& j) {
    if (!j.is_object()) {
        throw InvalidInput("Request must be a JSON object");
    }
    if (!j.contains("listing")) {
        throw InvalidInput("Request missing required field: listing");
    }

    ArbitrageRequest request;
    request.id = optional_string(j, "id");
    request.listing = parse_listing(j["listing"]);

    if (j.contains("comparables")) {
        request.comparables = parse_comparables(j["comparables"]);
    }
    if (j.contains("import_costs")) {
        request.cost_overrides = parse_cost_overrides(j["import_costs"]);
    }
    if (j.contains("thresholds")) {
        request.thresholds = parse_thresholds(j["thresholds"]);
    }
    if (j.contains("market_value_override") && !j["market_value_override"].is_null()) {
        request.market_value_override = require_number(j, "market_value_override", "request");
    }

    return request;
}

json parse_document(const std::string& json_string) {
    try {
        return json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
}

std::string read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open request file: " + filepath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

ArbitrageRequest parse_request_from_string(const std::string& json_string) {
    json j = parse_document(json_string);
    try {
        return parse_request(j);
    } catch (const json::type_error& e) {
        throw InvalidInput(std::string("Request type error: ") + e.what());
    }
}

ArbitrageRequest parse_request_from_file(const std::string& filepath) {
    return parse_request_from_string(read_file(filepath));
}

std::vector<ArbitrageRequest> parse_batch_from_string(const std::string& json_string) {
    json j = parse_document(json_string);

    const json* items = &j;
    if (j.is_object() && j.contains("requests")) {
        items = &j["requests"];
    }
    if (!items->is_array()) {
        throw InvalidInput("Batch must be an array of requests or {\"requests\": [...]}");
    }

    std::vector<ArbitrageRequest> requests;
    requests.reserve(items->size());
    for (size_t i = 0; i < items->size(); ++i) {
        try {
            ArbitrageRequest request = parse_request((*items)[i]);
            if (request.id.empty()) {
                request.id = std::to_string(i + 1);
            }
            requests.push_back(std::move(request));
        } catch (const InvalidInput& e) {
            throw InvalidInput("Batch request " + std::to_string(i + 1) + ": " + e.what());
        } catch (const json::type_error& e) {
            throw InvalidInput("Batch request " + std::to_string(i + 1) + ": " + e.what());
        }
    }
    return requests;
}

std::vector<ArbitrageRequest> parse_batch_from_file(const std::string& filepath) {
    return parse_batch_from_string(read_file(filepath));
}

} // namespace io
} // namespace importcalc
