#ifndef IMPORTCALC_MARKET_VALUE_HPP
#define IMPORTCALC_MARKET_VALUE_HPP

#include "vehicle.hpp"
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace importcalc {

// A listing observed on the destination market
struct Comparable {
    double price;
    double mileage_km;
    std::string source;    // e.g. "marktplaats", "autoscout24.nl"

    Comparable();
    Comparable(double price, double mileage = 0.0, std::string source = "");
};

// CSV columns: price,mileage_km[,source]
std::vector<Comparable> load_comparables_from_csv(const std::string& filepath);
std::vector<Comparable> load_comparables_from_csv(std::istream& is);

// Minimum sample size for quartile-based outlier filtering
constexpr size_t IQR_MIN_SAMPLE = 4;

// Interquartile-range outlier filter.
// Sorts ascending, takes Q1 = p[floor(n * 0.25)] and Q3 = p[floor(n * 0.75)]
// (index-based, not interpolated) and keeps prices within
// [Q1 - 1.5 * IQR, Q3 + 1.5 * IQR]. Samples smaller than IQR_MIN_SAMPLE are
// returned sorted but unfiltered. If nothing survives, all prices are kept.
std::vector<double> filter_outliers_iqr(std::vector<double> prices);

struct MarketEstimate {
    double value;
    size_t comparables_count;   // Comparables supplied
    size_t retained_count;      // Comparables the value is based on
    std::string method;         // "single", "mean", "iqr", or a refiner name

    MarketEstimate();
};

// Market value from comparable prices:
//   0 comparables   -> InsufficientData
//   1               -> its price
//   2-3             -> mean, rounded to whole units
//   4+              -> mean of IQR-filtered prices, rounded to whole units
// Throws InvalidInput for non-positive or non-finite prices.
MarketEstimate estimate_market_value(const std::vector<Comparable>& comparables);

// Summary of the (outlier-filtered) comparable prices, for reporting
struct MarketStats {
    size_t count;           // Comparables supplied
    double avg_price;       // Rounded to cents
    double min_price;
    double max_price;
    double median_price;    // Element n/2 of the sorted filtered prices

    MarketStats();
};

// All-zero stats for an empty input; never throws InsufficientData
MarketStats compute_market_stats(const std::vector<Comparable>& comparables);

/**
 * @brief Strategy for turning comparables into a market value
 *
 * The arbitrage engine uses IqrMarketValueEstimator unless a caller supplies
 * another estimator (e.g. an external valuation refiner), in which case the
 * built-in estimation is bypassed entirely.
 */
class MarketValueEstimator {
public:
    virtual ~MarketValueEstimator() = default;

    virtual MarketEstimate estimate(const Listing& listing,
                                    const std::vector<Comparable>& comparables) const = 0;

    virtual std::string name() const = 0;
};

class IqrMarketValueEstimator : public MarketValueEstimator {
public:
    MarketEstimate estimate(const Listing& listing,
                            const std::vector<Comparable>& comparables) const override;
    std::string name() const override { return "iqr"; }
};

// Carries a value produced outside the engine
class FixedMarketValueEstimator : public MarketValueEstimator {
public:
    // Throws InvalidInput unless value is positive and finite
    explicit FixedMarketValueEstimator(double value, std::string source = "override");

    MarketEstimate estimate(const Listing& listing,
                            const std::vector<Comparable>& comparables) const override;
    std::string name() const override { return source_; }

private:
    double value_;
    std::string source_;
};

} // namespace importcalc

#endif // IMPORTCALC_MARKET_VALUE_HPP
