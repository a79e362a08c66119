#include "tax_engine.hpp"
#include "errors.hpp"
#include "money.hpp"
#include <cmath>

namespace importcalc {

TaxResult::TaxResult()
    : base_amount(0.0),
      variable_amount(0.0),
      gross_amount(0.0),
      surcharge(0.0),
      total_gross(0.0),
      vehicle_age_months(0),
      depreciation_percentage(0.0),
      payable(0.0) {}

namespace {

void check_emission(double co2_gkm) {
    if (!std::isfinite(co2_gkm)) {
        throw InvalidInput("CO2 emission must be a finite number");
    }
    if (co2_gkm < 0.0) {
        throw InvalidInput("CO2 emission must be non-negative, got " + std::to_string(co2_gkm));
    }
}

} // anonymous namespace

GrossLiability calculate_gross_liability(double co2_gkm, const BracketTable& brackets) {
    GrossLiability gross;
    gross.base_amount = round_currency(brackets.base_amount());

    // Zero-emission vehicles pay the flat base only
    if (co2_gkm == 0.0) {
        gross.variable_amount = 0.0;
        gross.total = gross.base_amount;
        return gross;
    }

    // Round the variable part, then the sum
    gross.variable_amount = round_currency(brackets.variable_amount(co2_gkm));
    gross.total = round_currency(gross.base_amount + gross.variable_amount);
    return gross;
}

TaxResult compute_tax_liability(double co2_gkm,
                                FuelCategory fuel,
                                int age_months,
                                const TaxSchedule& schedule) {
    check_emission(co2_gkm);
    if (age_months < 0) {
        throw InvalidInput("Vehicle age must be non-negative, got " +
                           std::to_string(age_months) + " months");
    }

    TaxResult result;
    result.vehicle_age_months = age_months;

    GrossLiability gross = calculate_gross_liability(co2_gkm, schedule.brackets());
    result.base_amount = gross.base_amount;
    result.variable_amount = gross.variable_amount;
    result.gross_amount = gross.total;

    result.surcharge = round_currency(schedule.surcharge().amount_for(fuel, co2_gkm));
    result.total_gross = round_currency(result.gross_amount + result.surcharge);

    // Depreciation applies to the combined total, not to each part
    result.depreciation_percentage = schedule.depreciation().percentage_for_age(age_months);
    double remaining_factor = 1.0 - result.depreciation_percentage / 100.0;
    result.payable = round_currency(result.total_gross * remaining_factor);

    return result;
}

TaxResult compute_tax_liability(double co2_gkm,
                                FuelCategory fuel,
                                const CalendarDate& first_registration,
                                const std::optional<CalendarDate>& evaluation_date,
                                const TaxSchedule& schedule,
                                const Clock& clock) {
    CalendarDate evaluated_on = evaluation_date ? *evaluation_date : clock.today();
    int age_months = months_between(first_registration, evaluated_on);
    return compute_tax_liability(co2_gkm, fuel, age_months, schedule);
}

TaxResult compute_tax_liability(const VehicleFacts& vehicle,
                                const TaxSchedule& schedule,
                                const Clock& clock) {
    return compute_tax_liability(vehicle.co2_gkm, vehicle.fuel, vehicle.first_registration,
                                 vehicle.evaluation_date, schedule, clock);
}

double quick_tax_estimate(double co2_gkm,
                          FuelCategory fuel,
                          int age_months,
                          const TaxSchedule& schedule) {
    return compute_tax_liability(co2_gkm, fuel, age_months, schedule).payable;
}

} // namespace importcalc
