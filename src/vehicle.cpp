#include "vehicle.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace importcalc {

namespace {

std::string normalize_label(const std::string& label) {
    auto start = std::find_if_not(label.begin(), label.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(label.rbegin(), label.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    std::string result = (start < end) ? std::string(start, end) : std::string();
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

// Matched as substrings, first hit wins. A primary fuel named in a hybrid
// label ("Diesel hybrid") decides the category, so diesel hybrids keep the
// diesel surcharge. "gasoline" must hit petrol before gas.
const std::array<std::pair<const char*, FuelCategory>, 20> FUEL_TERMS = {{
    {"diesel", FuelCategory::Diesel},
    {"petrol", FuelCategory::Petrol},
    {"benzin", FuelCategory::Petrol},
    {"gasoline", FuelCategory::Petrol},
    {"super", FuelCategory::Petrol},
    {"electric", FuelCategory::Electric},
    {"elektrisch", FuelCategory::Electric},
    {"elektro", FuelCategory::Electric},
    {"bev", FuelCategory::Electric},
    {"hybrid", FuelCategory::Hybrid},
    {"hybride", FuelCategory::Hybrid},
    {"phev", FuelCategory::Hybrid},
    {"lpg", FuelCategory::Gas},
    {"cng", FuelCategory::Gas},
    {"autogas", FuelCategory::Gas},
    {"erdgas", FuelCategory::Gas},
    {"aardgas", FuelCategory::Gas},
    {"gas", FuelCategory::Gas},
    {"waterstof", FuelCategory::Gas},
    {"hydrogen", FuelCategory::Gas},
}};

} // anonymous namespace

std::string fuel_category_to_string(FuelCategory fuel) {
    switch (fuel) {
        case FuelCategory::Petrol: return "petrol";
        case FuelCategory::Diesel: return "diesel";
        case FuelCategory::Electric: return "electric";
        case FuelCategory::Hybrid: return "hybrid";
        case FuelCategory::Gas: return "gas";
    }
    return "unknown";
}

FuelCategory parse_fuel_category(const std::string& label) {
    std::string normalized = normalize_label(label);
    if (normalized.empty()) {
        throw InvalidInput("Fuel type must not be empty");
    }

    // Short codes only match exactly
    if (normalized == "ev") {
        return FuelCategory::Electric;
    }

    for (const auto& [term, fuel] : FUEL_TERMS) {
        if (normalized.find(term) != std::string::npos) {
            return fuel;
        }
    }

    throw InvalidInput("Unrecognized fuel type: " + label);
}

// ============================================================================
// VehicleFacts / Listing
// ============================================================================

VehicleFacts::VehicleFacts()
    : co2_gkm(0.0)
    , fuel(FuelCategory::Petrol)
    , first_registration()
    , evaluation_date() {
}

VehicleFacts::VehicleFacts(double co2, FuelCategory f, const CalendarDate& registered)
    : co2_gkm(co2)
    , fuel(f)
    , first_registration(registered)
    , evaluation_date() {
}

Listing::Listing()
    : price(0.0)
    , vehicle()
    , mileage_km(0.0)
    , year(0) {
}

std::string Listing::description() const {
    std::string desc;
    auto append = [&desc](const std::string& part) {
        if (part.empty()) return;
        if (!desc.empty()) desc += " ";
        desc += part;
    };
    if (year > 0) append(std::to_string(year));
    append(make);
    append(model);
    return desc;
}

} // namespace importcalc
