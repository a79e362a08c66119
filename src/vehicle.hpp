#ifndef IMPORTCALC_VEHICLE_HPP
#define IMPORTCALC_VEHICLE_HPP

#include "calendar.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace importcalc {

enum class FuelCategory : uint8_t {
    Petrol = 0,
    Diesel = 1,
    Electric = 2,
    Hybrid = 3,
    Gas = 4
};

// Canonical lower-case name ("petrol", "diesel", ...)
std::string fuel_category_to_string(FuelCategory fuel);

// Normalize a free-text fuel label from a listing source.
// Accepts Dutch/German/English variants ("benzine", "elektrisch", "lpg", ...).
// Throws InvalidInput for labels that match no category.
FuelCategory parse_fuel_category(const std::string& label);

// Facts the tax engine needs about a vehicle
struct VehicleFacts {
    double co2_gkm;                              // WLTP CO2 emission, g/km
    FuelCategory fuel;
    CalendarDate first_registration;
    std::optional<CalendarDate> evaluation_date; // Empty = today per injected clock

    VehicleFacts();
    VehicleFacts(double co2, FuelCategory f, const CalendarDate& registered);
};

// A listing offered for import (the source market side of the trade)
struct Listing {
    double price;
    VehicleFacts vehicle;
    double mileage_km;
    std::string make;
    std::string model;
    int year;
    std::string source;   // e.g. "mobile.de", "autoscout24", "manual"

    Listing();

    // "<year> <make> <model>", skipping empty parts
    std::string description() const;
};

} // namespace importcalc

#endif // IMPORTCALC_VEHICLE_HPP
