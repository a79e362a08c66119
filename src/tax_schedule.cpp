#include "tax_schedule.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <utility>

namespace importcalc {

// ============================================================================
// TaxBracket Implementation
// ============================================================================

TaxBracket::TaxBracket()
    : min_co2(0.0)
    , max_co2(UNBOUNDED)
    , rate_per_gram(0.0)
    , base_amount(0.0) {
}

TaxBracket::TaxBracket(double min, double max, double rate, double base)
    : min_co2(min)
    , max_co2(max)
    , rate_per_gram(rate)
    , base_amount(base) {
}

bool TaxBracket::operator==(const TaxBracket& other) const {
    return min_co2 == other.min_co2 &&
           max_co2 == other.max_co2 &&
           rate_per_gram == other.rate_per_gram &&
           base_amount == other.base_amount;
}

// ============================================================================
// BracketTable Implementation
// ============================================================================

BracketTable::BracketTable() = default;

BracketTable::BracketTable(std::vector<TaxBracket> brackets)
    : brackets_(std::move(brackets)) {
    validate();
}

void BracketTable::add(const TaxBracket& bracket) {
    brackets_.push_back(bracket);
}

void BracketTable::validate() const {
    if (brackets_.empty()) {
        throw ScheduleError("Bracket table is empty");
    }
    if (brackets_.front().min_co2 != 0.0) {
        throw ScheduleError("First bracket must start at 0 g/km");
    }

    for (size_t i = 0; i < brackets_.size(); ++i) {
        const TaxBracket& b = brackets_[i];
        std::string where = "Bracket " + std::to_string(i + 1);

        if (!(b.max_co2 > b.min_co2)) {
            throw ScheduleError(where + ": upper bound must exceed lower bound");
        }
        if (b.rate_per_gram < 0.0 || !std::isfinite(b.rate_per_gram)) {
            throw ScheduleError(where + ": rate per gram must be a non-negative number");
        }
        if (b.base_amount < 0.0 || !std::isfinite(b.base_amount)) {
            throw ScheduleError(where + ": base amount must be a non-negative number");
        }
        if (i > 0 && b.base_amount != 0.0) {
            throw ScheduleError(where + ": base amount is only allowed in the first bracket");
        }
        if (i > 0 && b.min_co2 != brackets_[i - 1].max_co2) {
            throw ScheduleError(where + ": lower bound " + std::to_string(b.min_co2) +
                                " does not continue previous upper bound " +
                                std::to_string(brackets_[i - 1].max_co2));
        }
        if (i + 1 < brackets_.size() && b.is_unbounded()) {
            throw ScheduleError(where + ": only the final bracket may be unbounded");
        }
    }

    if (!brackets_.back().is_unbounded()) {
        throw ScheduleError("Final bracket must be unbounded");
    }
}

double BracketTable::base_amount() const {
    return brackets_.empty() ? 0.0 : brackets_.front().base_amount;
}

double BracketTable::flat_band_limit() const {
    return brackets_.empty() ? 0.0 : brackets_.front().max_co2;
}

double BracketTable::variable_amount(double co2_gkm) const {
    double total = 0.0;
    for (const TaxBracket& b : brackets_) {
        if (co2_gkm <= b.min_co2) {
            break;
        }
        double grams_in_bracket = std::min(co2_gkm, b.max_co2) - b.min_co2;
        total += grams_in_bracket * b.rate_per_gram;
    }
    return total;
}

BracketTable BracketTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open bracket file: " + filepath);
    }
    return load_from_csv(file);
}

BracketTable BracketTable::load_from_csv(std::istream& is) {
    BracketTable table;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 3) {
            throw ConfigParseError("Bracket CSV requires columns: min_co2,max_co2,rate_per_gram[,base_amount]");
        }

        double min = parse_csv_number(row[0], "min_co2");
        double max = parse_csv_bound(row[1], "max_co2");
        double rate = parse_csv_number(row[2], "rate_per_gram");
        double base = row.size() > 3 && !row[3].empty() ? parse_csv_number(row[3], "base_amount") : 0.0;

        table.add(TaxBracket(min, max, rate, base));
    }

    table.validate();
    return table;
}

BracketTable BracketTable::reference_2026() {
    return BracketTable({
        TaxBracket(0, 79, 0.0, 667.0),
        TaxBracket(79, 124, 6.68),
        TaxBracket(124, 169, 67.40),
        TaxBracket(169, 199, 159.61),
        TaxBracket(199, UNBOUNDED, 490.91),
    });
}

// ============================================================================
// DepreciationTable Implementation
// ============================================================================

DepreciationStep::DepreciationStep()
    : max_age_months(UNBOUNDED)
    , percentage(0.0) {
}

DepreciationStep::DepreciationStep(double max_months, double pct)
    : max_age_months(max_months)
    , percentage(pct) {
}

bool DepreciationStep::operator==(const DepreciationStep& other) const {
    return max_age_months == other.max_age_months && percentage == other.percentage;
}

DepreciationTable::DepreciationTable() = default;

DepreciationTable::DepreciationTable(std::vector<DepreciationStep> steps)
    : steps_(std::move(steps)) {
    validate();
}

void DepreciationTable::add(const DepreciationStep& step) {
    steps_.push_back(step);
}

void DepreciationTable::validate() const {
    if (steps_.empty()) {
        throw ScheduleError("Depreciation table is empty");
    }

    for (size_t i = 0; i < steps_.size(); ++i) {
        const DepreciationStep& s = steps_[i];
        std::string where = "Depreciation step " + std::to_string(i + 1);

        if (s.max_age_months < 0.0) {
            throw ScheduleError(where + ": age bound must be non-negative");
        }
        if (!(s.percentage >= 0.0 && s.percentage <= 100.0)) {
            throw ScheduleError(where + ": percentage must be between 0 and 100");
        }
        if (i > 0) {
            const DepreciationStep& prev = steps_[i - 1];
            if (!(s.max_age_months > prev.max_age_months)) {
                throw ScheduleError(where + ": age bounds must be strictly increasing");
            }
            if (s.percentage < prev.percentage) {
                throw ScheduleError(where + ": percentages must not decrease with age");
            }
        }
    }

    if (steps_.back().max_age_months != UNBOUNDED) {
        throw ScheduleError("Final depreciation step must be unbounded");
    }
}

double DepreciationTable::percentage_for_age(int age_months) const {
    if (age_months < 0) {
        throw InvalidInput("Vehicle age must be non-negative, got " +
                           std::to_string(age_months) + " months");
    }
    for (const DepreciationStep& s : steps_) {
        if (static_cast<double>(age_months) <= s.max_age_months) {
            return s.percentage;
        }
    }
    return max_percentage();
}

double DepreciationTable::max_percentage() const {
    double max_pct = 0.0;
    for (const DepreciationStep& s : steps_) {
        max_pct = std::max(max_pct, s.percentage);
    }
    return max_pct;
}

DepreciationTable DepreciationTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open depreciation file: " + filepath);
    }
    return load_from_csv(file);
}

DepreciationTable DepreciationTable::load_from_csv(std::istream& is) {
    DepreciationTable table;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw ConfigParseError("Depreciation CSV requires columns: max_age_months,percentage");
        }

        table.add(DepreciationStep(parse_csv_bound(row[0], "max_age_months"),
                                   parse_csv_number(row[1], "percentage")));
    }

    table.validate();
    return table;
}

DepreciationTable DepreciationTable::reference_2026() {
    return DepreciationTable({
        {3, 0}, {6, 24}, {9, 33}, {18, 42}, {24, 49}, {36, 56}, {48, 63},
        {60, 70}, {72, 76}, {84, 81}, {96, 85}, {108, 88}, {120, 90},
        {UNBOUNDED, 92},
    });
}

// ============================================================================
// SurchargeRule Implementation
// ============================================================================

SurchargeRule::SurchargeRule()
    : fuel(FuelCategory::Diesel)
    , threshold_gkm(0.0)
    , rate_per_gram(0.0) {
}

SurchargeRule::SurchargeRule(FuelCategory f, double threshold, double rate)
    : fuel(f)
    , threshold_gkm(threshold)
    , rate_per_gram(rate) {
}

bool SurchargeRule::applies_to(FuelCategory f, double co2_gkm) const {
    return f == fuel && co2_gkm > threshold_gkm;
}

double SurchargeRule::amount_for(FuelCategory f, double co2_gkm) const {
    if (!applies_to(f, co2_gkm)) {
        return 0.0;
    }
    return (co2_gkm - threshold_gkm) * rate_per_gram;
}

SurchargeRule SurchargeRule::reference_2026() {
    return SurchargeRule(FuelCategory::Diesel, 70.0, 109.87);
}

// ============================================================================
// TaxSchedule Implementation
// ============================================================================

TaxSchedule::TaxSchedule(std::string label,
                         BracketTable brackets,
                         DepreciationTable depreciation,
                         SurchargeRule surcharge)
    : label_(std::move(label))
    , brackets_(std::move(brackets))
    , depreciation_(std::move(depreciation))
    , surcharge_(surcharge) {
    brackets_.validate();
    depreciation_.validate();
    if (surcharge_.threshold_gkm < 0.0 || !std::isfinite(surcharge_.threshold_gkm)) {
        throw ScheduleError("Surcharge threshold must be a non-negative number");
    }
    if (surcharge_.rate_per_gram < 0.0 || !std::isfinite(surcharge_.rate_per_gram)) {
        throw ScheduleError("Surcharge rate must be a non-negative number");
    }
}

TaxSchedule TaxSchedule::reference_2026() {
    return TaxSchedule("2026",
                       BracketTable::reference_2026(),
                       DepreciationTable::reference_2026(),
                       SurchargeRule::reference_2026());
}

} // namespace importcalc
