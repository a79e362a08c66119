#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <sstream>
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include "tax_schedule.hpp"

using namespace importcalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// BracketTable Tests
// ============================================================================

TEST_CASE("Reference bracket table", "[schedule][brackets]") {
    BracketTable table = BracketTable::reference_2026();

    REQUIRE(table.size() == 5);
    REQUIRE(table.base_amount() == 667.0);
    REQUIRE(table.flat_band_limit() == 79.0);
    REQUIRE(table.brackets().back().is_unbounded());
    REQUIRE(table.brackets()[2] == TaxBracket(124, 169, 67.40));
}

TEST_CASE("Bracket accumulation is marginal", "[schedule][brackets]") {
    BracketTable table = BracketTable::reference_2026();

    REQUIRE(table.variable_amount(0.0) == 0.0);
    REQUIRE(table.variable_amount(79.0) == 0.0);
    REQUIRE_THAT(table.variable_amount(80.0), WithinAbs(6.68, 1e-9));
    REQUIRE_THAT(table.variable_amount(124.0), WithinAbs(300.60, 1e-9));
    REQUIRE_THAT(table.variable_amount(150.0), WithinAbs(300.60 + 26 * 67.40, 1e-9));
    REQUIRE_THAT(table.variable_amount(200.0),
                 WithinAbs(300.60 + 45 * 67.40 + 30 * 159.61 + 490.91, 1e-9));
}

TEST_CASE("Bracket validation rejects broken tables", "[schedule][brackets][error]") {
    SECTION("Empty table") {
        REQUIRE_THROWS_AS(BracketTable(std::vector<TaxBracket>{}), ScheduleError);
    }

    SECTION("First bracket not at zero") {
        REQUIRE_THROWS_AS(BracketTable({TaxBracket(10, UNBOUNDED, 1.0)}), ScheduleError);
    }

    SECTION("Gap between brackets") {
        REQUIRE_THROWS_AS(BracketTable({TaxBracket(0, 79, 0.0, 667.0),
                                        TaxBracket(80, UNBOUNDED, 6.68)}),
                          ScheduleError);
    }

    SECTION("Overlapping brackets") {
        REQUIRE_THROWS_AS(BracketTable({TaxBracket(0, 79, 0.0, 667.0),
                                        TaxBracket(70, UNBOUNDED, 6.68)}),
                          ScheduleError);
    }

    SECTION("Bounded final bracket") {
        REQUIRE_THROWS_AS(BracketTable({TaxBracket(0, 79, 0.0, 667.0),
                                        TaxBracket(79, 200, 6.68)}),
                          ScheduleError);
    }

    SECTION("Negative rate") {
        REQUIRE_THROWS_AS(BracketTable({TaxBracket(0, UNBOUNDED, -1.0)}), ScheduleError);
    }

    SECTION("Base amount outside the first bracket") {
        REQUIRE_THROWS_AS(BracketTable({TaxBracket(0, 79, 0.0, 667.0),
                                        TaxBracket(79, UNBOUNDED, 6.68, 10.0)}),
                          ScheduleError);
    }
}

TEST_CASE("BracketTable CSV loading", "[schedule][brackets][csv]") {
    std::stringstream csv;
    csv << "# test brackets\n";
    csv << "min_co2,max_co2,rate_per_gram,base_amount\n";
    csv << "0,100,0,500\n";
    csv << "100,inf,10,0\n";

    BracketTable table = BracketTable::load_from_csv(csv);

    REQUIRE(table.size() == 2);
    REQUIRE(table.base_amount() == 500.0);
    REQUIRE(table.brackets()[1].is_unbounded());
    REQUIRE_THAT(table.variable_amount(110.0), WithinAbs(100.0, 1e-9));
}

TEST_CASE("BracketTable CSV errors", "[schedule][brackets][csv][error]") {
    SECTION("Non-numeric cell") {
        std::stringstream csv("min_co2,max_co2,rate_per_gram\n0,abc,1\n");
        REQUIRE_THROWS_AS(BracketTable::load_from_csv(csv), ConfigParseError);
    }

    SECTION("Too few columns") {
        std::stringstream csv("min_co2,max_co2,rate_per_gram\n0,inf\n");
        REQUIRE_THROWS_AS(BracketTable::load_from_csv(csv), ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(BracketTable::load_from_csv("does/not/exist.csv"), ConfigParseError);
    }

    SECTION("Table violates invariants") {
        std::stringstream csv("min_co2,max_co2,rate_per_gram\n0,79,0\n");
        REQUIRE_THROWS_AS(BracketTable::load_from_csv(csv), ScheduleError);
    }
}

TEST_CASE("Bundled bracket file matches the reference table", "[schedule][brackets][data]") {
    BracketTable table = BracketTable::load_from_csv(std::string(IMPORTCALC_DATA_DIR) + "/bpm_brackets_2026.csv");
    REQUIRE(table.brackets() == BracketTable::reference_2026().brackets());
}

// ============================================================================
// DepreciationTable Tests
// ============================================================================

TEST_CASE("Reference depreciation lookup", "[schedule][depreciation]") {
    DepreciationTable table = DepreciationTable::reference_2026();

    REQUIRE(table.size() == 14);
    REQUIRE(table.percentage_for_age(0) == 0.0);
    REQUIRE(table.percentage_for_age(3) == 0.0);
    REQUIRE(table.percentage_for_age(4) == 24.0);
    REQUIRE(table.percentage_for_age(6) == 24.0);
    REQUIRE(table.percentage_for_age(24) == 49.0);
    REQUIRE(table.percentage_for_age(46) == 63.0);
    REQUIRE(table.percentage_for_age(60) == 70.0);
    REQUIRE(table.percentage_for_age(120) == 90.0);
    REQUIRE(table.percentage_for_age(121) == 92.0);
    REQUIRE(table.percentage_for_age(600) == 92.0);
    REQUIRE(table.max_percentage() == 92.0);
}

TEST_CASE("Depreciation rejects negative ages", "[schedule][depreciation][error]") {
    REQUIRE_THROWS_AS(DepreciationTable::reference_2026().percentage_for_age(-1), InvalidInput);
}

TEST_CASE("Depreciation percentage never decreases with age", "[schedule][depreciation]") {
    DepreciationTable table = DepreciationTable::reference_2026();
    double previous = 0.0;
    for (int age = 0; age <= 240; ++age) {
        double pct = table.percentage_for_age(age);
        REQUIRE(pct >= previous);
        previous = pct;
    }
}

TEST_CASE("Depreciation validation rejects broken tables", "[schedule][depreciation][error]") {
    SECTION("Bounds not increasing") {
        REQUIRE_THROWS_AS(DepreciationTable({DepreciationStep(6, 10),
                                             DepreciationStep(6, 20),
                                             DepreciationStep(UNBOUNDED, 30)}),
                          ScheduleError);
    }

    SECTION("Decreasing percentage") {
        REQUIRE_THROWS_AS(DepreciationTable({DepreciationStep(6, 30),
                                             DepreciationStep(UNBOUNDED, 20)}),
                          ScheduleError);
    }

    SECTION("Percentage out of range") {
        REQUIRE_THROWS_AS(DepreciationTable({DepreciationStep(UNBOUNDED, 101)}), ScheduleError);
        REQUIRE_THROWS_AS(DepreciationTable({DepreciationStep(UNBOUNDED, -1)}), ScheduleError);
    }

    SECTION("Bounded final step") {
        REQUIRE_THROWS_AS(DepreciationTable({DepreciationStep(6, 10),
                                             DepreciationStep(12, 20)}),
                          ScheduleError);
    }
}

TEST_CASE("DepreciationTable CSV loading", "[schedule][depreciation][csv]") {
    std::stringstream csv;
    csv << "max_age_months,percentage\n";
    csv << "12,10\n";
    csv << "\n";
    csv << "inf,50\n";

    DepreciationTable table = DepreciationTable::load_from_csv(csv);
    REQUIRE(table.size() == 2);
    REQUIRE(table.percentage_for_age(12) == 10.0);
    REQUIRE(table.percentage_for_age(13) == 50.0);
}

TEST_CASE("Bundled depreciation file matches the reference table", "[schedule][depreciation][data]") {
    DepreciationTable table =
        DepreciationTable::load_from_csv(std::string(IMPORTCALC_DATA_DIR) + "/depreciation_2026.csv");
    REQUIRE(table.steps() == DepreciationTable::reference_2026().steps());
}

// ============================================================================
// SurchargeRule / TaxSchedule Tests
// ============================================================================

TEST_CASE("Diesel surcharge applies strictly above the threshold", "[schedule][surcharge]") {
    SurchargeRule rule = SurchargeRule::reference_2026();

    REQUIRE(rule.fuel == FuelCategory::Diesel);
    REQUIRE_FALSE(rule.applies_to(FuelCategory::Diesel, 70.0));
    REQUIRE(rule.applies_to(FuelCategory::Diesel, 70.5));
    REQUIRE_FALSE(rule.applies_to(FuelCategory::Petrol, 200.0));
    REQUIRE_FALSE(rule.applies_to(FuelCategory::Hybrid, 200.0));

    REQUIRE(rule.amount_for(FuelCategory::Diesel, 70.0) == 0.0);
    REQUIRE_THAT(rule.amount_for(FuelCategory::Diesel, 71.0), WithinAbs(109.87, 1e-9));
    REQUIRE(rule.amount_for(FuelCategory::Petrol, 150.0) == 0.0);
}

TEST_CASE("TaxSchedule reference bundle", "[schedule]") {
    TaxSchedule schedule = TaxSchedule::reference_2026();

    REQUIRE(schedule.label() == "2026");
    REQUIRE(schedule.brackets().size() == 5);
    REQUIRE(schedule.depreciation().size() == 14);
    REQUIRE(schedule.surcharge().threshold_gkm == 70.0);
}

TEST_CASE("TaxSchedule validates its surcharge", "[schedule][error]") {
    REQUIRE_THROWS_AS(TaxSchedule("bad",
                                  BracketTable::reference_2026(),
                                  DepreciationTable::reference_2026(),
                                  SurchargeRule(FuelCategory::Diesel, -1.0, 100.0)),
                      ScheduleError);
}

TEST_CASE("Unbounded CSV cells", "[schedule][csv]") {
    REQUIRE(std::isinf(parse_csv_bound("INF", "max_co2")));
    REQUIRE(std::isinf(parse_csv_bound("Infinity", "max_co2")));
    REQUIRE(std::isinf(parse_csv_bound("", "max_co2")));
    REQUIRE(parse_csv_bound("79", "max_co2") == 79.0);
    REQUIRE_THROWS_AS(parse_csv_bound("\xE2\x88\x9E", "max_co2"), ConfigParseError);
}
