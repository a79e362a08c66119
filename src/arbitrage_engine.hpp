#ifndef IMPORTCALC_ARBITRAGE_ENGINE_HPP
#define IMPORTCALC_ARBITRAGE_ENGINE_HPP

#include "calendar.hpp"
#include "import_costs.hpp"
#include "market_value.hpp"
#include "tax_engine.hpp"
#include "tax_schedule.hpp"
#include "vehicle.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace importcalc {

enum class Recommendation : uint8_t {
    NoGo = 0,
    Consider = 1,
    Go = 2
};

// "GO", "CONSIDER", "NO_GO"
std::string recommendation_to_string(Recommendation rec);

// Margin thresholds for the recommendation. Meeting a threshold exactly
// counts as reaching its tier.
struct RecommendationThresholds {
    double go;          // default 2500
    double consider;    // default 1000

    RecommendationThresholds();
    RecommendationThresholds(double go_threshold, double consider_threshold);

    // Throws InvalidInput if consider > go or a value is not finite
    void validate() const;
};

Recommendation classify_margin(double margin, const RecommendationThresholds& thresholds);

// Every cost line entering the margin
struct CostBreakdown {
    double listing_price;
    double tax;                 // Payable registration tax
    double transport;
    double rdw_inspection;
    double license_plates;
    double handling_fee;
    double nap_check;
    double other;
    double total_import_costs;
    double total_cost;          // listing_price + tax + total_import_costs

    CostBreakdown();
};

// Configuration shared by all analyses. Immutable once built.
struct ArbitrageConfig {
    TaxSchedule schedule;
    ImportCosts default_costs;
    RecommendationThresholds thresholds;

    // 2026 reference schedule, default costs and thresholds
    ArbitrageConfig();
    ArbitrageConfig(TaxSchedule s, ImportCosts costs, RecommendationThresholds t);
};

// One analysis: a listing, its comparables and per-request overrides
struct ArbitrageRequest {
    std::string id;                                       // Caller reference, echoed in batch output
    Listing listing;
    std::vector<Comparable> comparables;
    ImportCostOverrides cost_overrides;
    std::optional<RecommendationThresholds> thresholds;   // Replaces config thresholds
    std::optional<double> market_value_override;          // Refined valuation, bypasses IQR
};

struct ArbitrageResult {
    double listing_price;
    double market_value;
    size_t comparables_count;
    size_t comparables_retained;
    std::string market_value_method;

    TaxResult tax;
    CostBreakdown costs;

    double margin;              // market_value - total_cost, rounded to cents
    double margin_percentage;   // margin / total_cost * 100, rounded to cents
    Recommendation recommendation;

    // Informational only, never used for the recommendation
    double quick_sale_price;    // 90% of market_value, truncated to whole units
    double safe_margin;         // quick_sale_price - total_cost, rounded to cents

    std::string vehicle_description;
    int vehicle_age_months;

    ArbitrageResult();
};

// Full analysis with the built-in IQR estimator (or the request's
// market_value_override when set).
// Throws InsufficientData (no comparables), InvalidInput, DivisionUndefined.
ArbitrageResult compute_arbitrage(const ArbitrageRequest& request,
                                  const ArbitrageConfig& config,
                                  const Clock& clock = system_clock());

// Full analysis with an explicit market value strategy
ArbitrageResult compute_arbitrage(const ArbitrageRequest& request,
                                  const ArbitrageConfig& config,
                                  const MarketValueEstimator& estimator,
                                  const Clock& clock = system_clock());

// Margin and recommendation without a full breakdown
struct QuickMargin {
    double margin;              // Rounded to whole units
    Recommendation recommendation;
};

QuickMargin quick_margin_estimate(double listing_price,
                                  double market_value,
                                  double tax,
                                  double import_costs = 800.0,
                                  const RecommendationThresholds& thresholds = RecommendationThresholds());

} // namespace importcalc

#endif // IMPORTCALC_ARBITRAGE_ENGINE_HPP
