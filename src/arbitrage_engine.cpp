#include "arbitrage_engine.hpp"
#include "errors.hpp"
#include "money.hpp"
#include <cmath>
#include <utility>

namespace importcalc {

namespace {

// Price expected when the car has to be sold quickly
constexpr double QUICK_SALE_FACTOR = 0.9;

} // anonymous namespace

std::string recommendation_to_string(Recommendation rec) {
    switch (rec) {
        case Recommendation::Go: return "GO";
        case Recommendation::Consider: return "CONSIDER";
        case Recommendation::NoGo: return "NO_GO";
    }
    return "NO_GO";
}

// ============================================================================
// Thresholds
// ============================================================================

RecommendationThresholds::RecommendationThresholds()
    : go(2500.0), consider(1000.0) {}

RecommendationThresholds::RecommendationThresholds(double go_threshold, double consider_threshold)
    : go(go_threshold), consider(consider_threshold) {}

void RecommendationThresholds::validate() const {
    if (!std::isfinite(go) || !std::isfinite(consider)) {
        throw InvalidInput("Recommendation thresholds must be finite numbers");
    }
    if (consider > go) {
        throw InvalidInput("CONSIDER threshold (" + std::to_string(consider) +
                           ") must not exceed GO threshold (" + std::to_string(go) + ")");
    }
}

Recommendation classify_margin(double margin, const RecommendationThresholds& thresholds) {
    if (margin >= thresholds.go) {
        return Recommendation::Go;
    }
    if (margin >= thresholds.consider) {
        return Recommendation::Consider;
    }
    return Recommendation::NoGo;
}

// ============================================================================
// Value types
// ============================================================================

CostBreakdown::CostBreakdown()
    : listing_price(0.0), tax(0.0), transport(0.0), rdw_inspection(0.0),
      license_plates(0.0), handling_fee(0.0), nap_check(0.0), other(0.0),
      total_import_costs(0.0), total_cost(0.0) {}

ArbitrageConfig::ArbitrageConfig()
    : schedule(TaxSchedule::reference_2026()),
      default_costs(),
      thresholds() {}

ArbitrageConfig::ArbitrageConfig(TaxSchedule s, ImportCosts costs, RecommendationThresholds t)
    : schedule(std::move(s)),
      default_costs(costs),
      thresholds(t) {
    default_costs.validate();
    thresholds.validate();
}

ArbitrageResult::ArbitrageResult()
    : listing_price(0.0),
      market_value(0.0),
      comparables_count(0),
      comparables_retained(0),
      margin(0.0),
      margin_percentage(0.0),
      recommendation(Recommendation::NoGo),
      quick_sale_price(0.0),
      safe_margin(0.0),
      vehicle_age_months(0) {}

// ============================================================================
// Analysis
// ============================================================================

ArbitrageResult compute_arbitrage(const ArbitrageRequest& request,
                                  const ArbitrageConfig& config,
                                  const Clock& clock) {
    if (request.market_value_override) {
        FixedMarketValueEstimator refined(*request.market_value_override, "override");
        return compute_arbitrage(request, config, refined, clock);
    }
    IqrMarketValueEstimator iqr;
    return compute_arbitrage(request, config, iqr, clock);
}

ArbitrageResult compute_arbitrage(const ArbitrageRequest& request,
                                  const ArbitrageConfig& config,
                                  const MarketValueEstimator& estimator,
                                  const Clock& clock) {
    const Listing& listing = request.listing;
    if (!std::isfinite(listing.price) || listing.price < 0.0) {
        throw InvalidInput("Listing price must be a non-negative number");
    }

    RecommendationThresholds thresholds = request.thresholds.value_or(config.thresholds);
    thresholds.validate();

    ImportCosts costs = request.cost_overrides.apply_to(config.default_costs);

    TaxResult tax = compute_tax_liability(listing.vehicle, config.schedule, clock);
    MarketEstimate estimate = estimator.estimate(listing, request.comparables);

    ArbitrageResult result;
    result.listing_price = listing.price;
    result.market_value = estimate.value;
    result.comparables_count = estimate.comparables_count;
    result.comparables_retained = estimate.retained_count;
    result.market_value_method = estimate.method;
    result.tax = tax;
    result.vehicle_description = listing.description();
    result.vehicle_age_months = tax.vehicle_age_months;

    CostBreakdown& breakdown = result.costs;
    breakdown.listing_price = listing.price;
    breakdown.tax = tax.payable;
    breakdown.transport = costs.transport;
    breakdown.rdw_inspection = costs.rdw_inspection;
    breakdown.license_plates = costs.license_plates;
    breakdown.handling_fee = costs.handling_fee;
    breakdown.nap_check = costs.nap_check;
    breakdown.other = costs.other;
    breakdown.total_import_costs = costs.total();
    breakdown.total_cost = listing.price + tax.payable + breakdown.total_import_costs;

    if (!(breakdown.total_cost > 0.0)) {
        throw DivisionUndefined("Total cost is " + std::to_string(breakdown.total_cost) +
                                "; margin percentage is undefined");
    }

    double margin = estimate.value - breakdown.total_cost;
    result.margin = round_currency(margin);
    result.margin_percentage = round_currency(margin / breakdown.total_cost * 100.0);
    result.recommendation = classify_margin(result.margin, thresholds);

    result.quick_sale_price = std::floor(estimate.value * QUICK_SALE_FACTOR);
    result.safe_margin = round_currency(result.quick_sale_price - breakdown.total_cost);

    return result;
}

QuickMargin quick_margin_estimate(double listing_price,
                                  double market_value,
                                  double tax,
                                  double import_costs,
                                  const RecommendationThresholds& thresholds) {
    thresholds.validate();
    double margin = market_value - (listing_price + tax + import_costs);
    QuickMargin quick;
    quick.margin = round_whole(margin);
    quick.recommendation = classify_margin(margin, thresholds);
    return quick;
}

} // namespace importcalc
