#ifndef IMPORTCALC_TAX_ENGINE_HPP
#define IMPORTCALC_TAX_ENGINE_HPP

#include "calendar.hpp"
#include "tax_schedule.hpp"
#include "vehicle.hpp"
#include <optional>

namespace importcalc {

// Breakdown of the registration tax (rest-BPM) for one vehicle.
// Currency fields are rounded to cents at each accumulation step.
struct TaxResult {
    double base_amount;             // Flat amount of the lowest bracket
    double variable_amount;         // Bracket-accumulated CO2 component
    double gross_amount;            // base + variable
    double surcharge;               // Fuel surcharge (diesel above threshold)
    double total_gross;             // gross + surcharge, before depreciation
    int vehicle_age_months;
    double depreciation_percentage; // 0-100
    double payable;                 // total_gross reduced by depreciation

    TaxResult();
};

// Gross liability components for an emission value
struct GrossLiability {
    double base_amount;
    double variable_amount;
    double total;
};

// Bracket accumulation. Zero emission pays the base amount only.
GrossLiability calculate_gross_liability(double co2_gkm, const BracketTable& brackets);

// Compute the tax for a vehicle of known age.
// Throws InvalidInput for negative/non-finite emission or negative age.
TaxResult compute_tax_liability(double co2_gkm,
                                FuelCategory fuel,
                                int age_months,
                                const TaxSchedule& schedule);

// Compute the tax from registration/evaluation dates. Without an evaluation
// date the clock supplies today.
TaxResult compute_tax_liability(double co2_gkm,
                                FuelCategory fuel,
                                const CalendarDate& first_registration,
                                const std::optional<CalendarDate>& evaluation_date,
                                const TaxSchedule& schedule,
                                const Clock& clock = system_clock());

TaxResult compute_tax_liability(const VehicleFacts& vehicle,
                                const TaxSchedule& schedule,
                                const Clock& clock = system_clock());

// Payable amount only
double quick_tax_estimate(double co2_gkm,
                          FuelCategory fuel,
                          int age_months,
                          const TaxSchedule& schedule);

} // namespace importcalc

#endif // IMPORTCALC_TAX_ENGINE_HPP
