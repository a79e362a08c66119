#include "text_report.hpp"
#include "../money.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace importcalc {
namespace io {

std::string format_currency(double amount) {
    double rounded = round_currency(amount);
    bool negative = rounded < 0.0;
    long long cents = static_cast<long long>(std::llround(std::fabs(rounded) * 100.0));
    long long units = cents / 100;

    std::string digits = std::to_string(units);
    std::string grouped;
    int since_separator = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (since_separator == 3) {
            grouped.insert(grouped.begin(), ',');
            since_separator = 0;
        }
        grouped.insert(grouped.begin(), *it);
        since_separator++;
    }

    std::ostringstream oss;
    oss << "EUR " << (negative ? "-" : "") << grouped << "."
        << std::setw(2) << std::setfill('0') << (cents % 100);
    return oss.str();
}

namespace {

const char* const RULE = "===============================================";
const char* const THIN_RULE = "  ---------------------------------------------";

void line(std::ostream& os, const std::string& label, const std::string& value) {
    os << "  " << std::left << std::setw(24) << (label + ":") << value << "\n";
}

std::string percent(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value << "%";
    return oss.str();
}

} // anonymous namespace

void write_analysis_report(std::ostream& os, const ArbitrageResult& result,
                           const MarketStats& stats) {
    const CostBreakdown& costs = result.costs;

    os << RULE << "\n";
    os << "  IMPORT MARGIN ANALYSIS\n";
    os << "  " << (result.vehicle_description.empty() ? "Unnamed vehicle" : result.vehicle_description) << "\n";
    os << RULE << "\n\n";

    os << "MARKET COMPARISON\n";
    line(os, "Source asking price", format_currency(result.listing_price));
    line(os, "Market value", format_currency(result.market_value));
    os << "  (Based on " << result.comparables_count << " comparable listing"
       << (result.comparables_count != 1 ? "s" : "");
    if (result.comparables_retained != result.comparables_count) {
        os << ", " << result.comparables_retained << " after outlier filtering";
    }
    os << "; method: " << result.market_value_method << ")\n";
    if (stats.count > 0) {
        line(os, "Comparable range", format_currency(stats.min_price) + " - " +
                                     format_currency(stats.max_price));
        line(os, "Comparable median", format_currency(stats.median_price));
    }
    os << "\n";

    os << "COST BREAKDOWN\n";
    line(os, "Asking price", format_currency(costs.listing_price));
    line(os, "BPM (rest-BPM)", format_currency(costs.tax));
    line(os, "Transport", format_currency(costs.transport));
    line(os, "RDW inspection", format_currency(costs.rdw_inspection));
    line(os, "License plates", format_currency(costs.license_plates));
    line(os, "Handling fee", format_currency(costs.handling_fee));
    line(os, "NAP check", format_currency(costs.nap_check));
    if (costs.other > 0.0) {
        line(os, "Other costs", format_currency(costs.other));
    }
    os << THIN_RULE << "\n";
    line(os, "TOTAL COST", format_currency(costs.total_cost));
    os << "\n";

    os << "BPM DETAILS\n";
    line(os, "Vehicle age", std::to_string(result.vehicle_age_months) + " months");
    line(os, "Gross BPM", format_currency(result.tax.total_gross));
    line(os, "Depreciation", percent(result.tax.depreciation_percentage, 0));
    line(os, "Rest-BPM", format_currency(result.tax.payable));
    os << "\n";

    os << RULE << "\n";
    os << "  RESULT: " << recommendation_to_string(result.recommendation) << "\n\n";
    line(os, "Potential margin", format_currency(result.margin));
    line(os, "ROI", percent(result.margin_percentage, 1));
    line(os, "Safe margin", format_currency(result.safe_margin) + " (quick sale at " +
                            format_currency(result.quick_sale_price) + ")");
    os << RULE << "\n";
}

void write_tax_report(std::ostream& os, const VehicleFacts& vehicle, const TaxResult& result) {
    os << "BPM CALCULATION\n";
    std::ostringstream co2;
    co2 << vehicle.co2_gkm << " g/km";
    line(os, "CO2 emission", co2.str());
    line(os, "Fuel", fuel_category_to_string(vehicle.fuel));
    line(os, "First registration", vehicle.first_registration.to_string());
    line(os, "Vehicle age", std::to_string(result.vehicle_age_months) + " months");
    os << THIN_RULE << "\n";
    line(os, "Base amount", format_currency(result.base_amount));
    line(os, "CO2 component", format_currency(result.variable_amount));
    line(os, "Gross BPM", format_currency(result.gross_amount));
    if (result.surcharge > 0.0) {
        line(os, "Fuel surcharge", format_currency(result.surcharge));
    }
    line(os, "Total gross", format_currency(result.total_gross));
    line(os, "Depreciation", percent(result.depreciation_percentage, 0));
    line(os, "Rest-BPM payable", format_currency(result.payable));
}

} // namespace io
} // namespace importcalc
