#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "tax_engine.hpp"
#include "vehicle.hpp"

using namespace importcalc;

TEST_CASE("Fuel labels from listing sources are normalized", "[vehicle][fuel]") {
    SECTION("Canonical names") {
        REQUIRE(parse_fuel_category("petrol") == FuelCategory::Petrol);
        REQUIRE(parse_fuel_category("diesel") == FuelCategory::Diesel);
        REQUIRE(parse_fuel_category("electric") == FuelCategory::Electric);
        REQUIRE(parse_fuel_category("hybrid") == FuelCategory::Hybrid);
        REQUIRE(parse_fuel_category("gas") == FuelCategory::Gas);
    }

    SECTION("Case and surrounding whitespace are ignored") {
        REQUIRE(parse_fuel_category("  Diesel ") == FuelCategory::Diesel);
        REQUIRE(parse_fuel_category("ELEKTRISCH") == FuelCategory::Electric);
    }

    SECTION("Dutch and German variants") {
        REQUIRE(parse_fuel_category("Benzine") == FuelCategory::Petrol);
        REQUIRE(parse_fuel_category("Benzin") == FuelCategory::Petrol);
        REQUIRE(parse_fuel_category("Elektro") == FuelCategory::Electric);
        REQUIRE(parse_fuel_category("Hybride") == FuelCategory::Hybrid);
        REQUIRE(parse_fuel_category("Autogas") == FuelCategory::Gas);
        REQUIRE(parse_fuel_category("LPG") == FuelCategory::Gas);
    }

    SECTION("Gasoline is petrol, not gas") {
        REQUIRE(parse_fuel_category("Gasoline") == FuelCategory::Petrol);
    }

    SECTION("Plain hybrid labels") {
        REQUIRE(parse_fuel_category("Plug-in Hybrid") == FuelCategory::Hybrid);
        REQUIRE(parse_fuel_category("PHEV") == FuelCategory::Hybrid);
    }

    SECTION("A named primary fuel wins over hybrid") {
        REQUIRE(parse_fuel_category("Diesel hybrid") == FuelCategory::Diesel);
        REQUIRE(parse_fuel_category("Hybrid (Diesel/Elektro)") == FuelCategory::Diesel);
        REQUIRE(parse_fuel_category("Hybrid (Benzine/Elektro)") == FuelCategory::Petrol);
        REQUIRE(parse_fuel_category("Elektro/Hybride") == FuelCategory::Electric);
    }

    SECTION("EV only as an exact code") {
        REQUIRE(parse_fuel_category("EV") == FuelCategory::Electric);
        REQUIRE_THROWS_AS(parse_fuel_category("seven"), InvalidInput);
    }
}

TEST_CASE("Diesel hybrid labels pay the diesel surcharge", "[vehicle][fuel][tax]") {
    const TaxSchedule schedule = TaxSchedule::reference_2026();
    TaxResult plain = compute_tax_liability(150.0, parse_fuel_category("diesel"), 12, schedule);

    for (const char* label : {"Diesel Hybrid", "Hybrid (Diesel/Elektro)"}) {
        TaxResult hybrid = compute_tax_liability(150.0, parse_fuel_category(label), 12, schedule);
        REQUIRE(hybrid.surcharge == plain.surcharge);
        REQUIRE(hybrid.surcharge > 0.0);
        REQUIRE(hybrid.payable == plain.payable);
    }
}

TEST_CASE("Unknown fuel labels are rejected", "[vehicle][fuel][error]") {
    REQUIRE_THROWS_AS(parse_fuel_category(""), InvalidInput);
    REQUIRE_THROWS_AS(parse_fuel_category("   "), InvalidInput);
    REQUIRE_THROWS_AS(parse_fuel_category("steam"), InvalidInput);
}

TEST_CASE("fuel_category_to_string round trips canonical names", "[vehicle][fuel]") {
    for (FuelCategory f : {FuelCategory::Petrol, FuelCategory::Diesel, FuelCategory::Electric,
                           FuelCategory::Hybrid, FuelCategory::Gas}) {
        REQUIRE(parse_fuel_category(fuel_category_to_string(f)) == f);
    }
}

TEST_CASE("Listing description skips missing parts", "[vehicle][listing]") {
    Listing listing;
    REQUIRE(listing.description().empty());

    listing.make = "Volkswagen";
    listing.model = "Golf";
    REQUIRE(listing.description() == "Volkswagen Golf");

    listing.year = 2022;
    REQUIRE(listing.description() == "2022 Volkswagen Golf");
}
