#ifndef IMPORTCALC_TAX_SCHEDULE_HPP
#define IMPORTCALC_TAX_SCHEDULE_HPP

#include "vehicle.hpp"
#include <istream>
#include <limits>
#include <string>
#include <vector>

namespace importcalc {

constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

// TaxBracket: CO2 range [min_co2, max_co2] taxed at rate_per_gram for each
// gram above min_co2. base_amount is the flat amount of the lowest bracket.
struct TaxBracket {
    double min_co2;
    double max_co2;          // UNBOUNDED for the final bracket
    double rate_per_gram;
    double base_amount;

    TaxBracket();
    TaxBracket(double min, double max, double rate, double base = 0.0);

    bool operator==(const TaxBracket& other) const;
    bool is_unbounded() const { return max_co2 == UNBOUNDED; }
};

// BracketTable: progressive CO2 brackets partitioning [0, inf)
class BracketTable {
public:
    BracketTable();

    // Validates the brackets; throws ScheduleError on gaps or overlaps
    explicit BracketTable(std::vector<TaxBracket> brackets);

    // Append without validating (call validate() when done)
    void add(const TaxBracket& bracket);

    // Checks: first bracket starts at 0, each lower bound equals the previous
    // upper bound, last bracket unbounded, non-negative rates, base amount
    // only in the first bracket
    void validate() const;

    const std::vector<TaxBracket>& brackets() const { return brackets_; }
    size_t size() const { return brackets_.size(); }
    bool empty() const { return brackets_.empty(); }

    // Flat amount owed regardless of emission
    double base_amount() const;

    // Upper bound of the lowest bracket (end of the flat band)
    double flat_band_limit() const;

    // Marginal accumulation over all brackets, unrounded
    double variable_amount(double co2_gkm) const;

    // CSV columns: min_co2,max_co2,rate_per_gram,base_amount ("inf" allowed)
    static BracketTable load_from_csv(const std::string& filepath);
    static BracketTable load_from_csv(std::istream& is);

    // 2026 Belastingdienst CO2 brackets
    static BracketTable reference_2026();

private:
    std::vector<TaxBracket> brackets_;
};

struct DepreciationStep {
    double max_age_months;   // UNBOUNDED for the final step
    double percentage;       // 0-100

    DepreciationStep();
    DepreciationStep(double max_months, double pct);

    bool operator==(const DepreciationStep& other) const;
};

// DepreciationTable: forfaitaire table, depreciation percentage by vehicle age
class DepreciationTable {
public:
    DepreciationTable();
    explicit DepreciationTable(std::vector<DepreciationStep> steps);

    void add(const DepreciationStep& step);

    // Checks: strictly increasing bounds, non-decreasing percentages in
    // [0, 100], final step unbounded
    void validate() const;

    // Percentage of the first step whose bound covers the age. A table that
    // covers nothing for this age yields max_percentage().
    // Throws InvalidInput for negative ages.
    double percentage_for_age(int age_months) const;

    double max_percentage() const;

    const std::vector<DepreciationStep>& steps() const { return steps_; }
    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

    // CSV columns: max_age_months,percentage ("inf" allowed)
    static DepreciationTable load_from_csv(const std::string& filepath);
    static DepreciationTable load_from_csv(std::istream& is);

    // 2026 forfaitaire afschrijvingstabel
    static DepreciationTable reference_2026();

private:
    std::vector<DepreciationStep> steps_;
};

// Surcharge for one fuel category above an emission threshold
struct SurchargeRule {
    FuelCategory fuel;
    double threshold_gkm;
    double rate_per_gram;

    SurchargeRule();
    SurchargeRule(FuelCategory f, double threshold, double rate);

    bool applies_to(FuelCategory f, double co2_gkm) const;

    // Unrounded surcharge; zero when the rule does not apply
    double amount_for(FuelCategory f, double co2_gkm) const;

    // 2026 diesel surcharge: 109.87 per g/km above 70 g/km
    static SurchargeRule reference_2026();
};

// Complete schedule for one tax year. Immutable once constructed.
class TaxSchedule {
public:
    // Validates all tables; throws ScheduleError
    TaxSchedule(std::string label,
                BracketTable brackets,
                DepreciationTable depreciation,
                SurchargeRule surcharge);

    const std::string& label() const { return label_; }
    const BracketTable& brackets() const { return brackets_; }
    const DepreciationTable& depreciation() const { return depreciation_; }
    const SurchargeRule& surcharge() const { return surcharge_; }

    static TaxSchedule reference_2026();

private:
    std::string label_;
    BracketTable brackets_;
    DepreciationTable depreciation_;
    SurchargeRule surcharge_;
};

} // namespace importcalc

#endif // IMPORTCALC_TAX_SCHEDULE_HPP
