#include "market_value.hpp"
#include "errors.hpp"
#include "money.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <utility>

namespace importcalc {

Comparable::Comparable()
    : price(0.0), mileage_km(0.0) {}

Comparable::Comparable(double price_, double mileage, std::string source_)
    : price(price_), mileage_km(mileage), source(std::move(source_)) {}

MarketEstimate::MarketEstimate()
    : value(0.0), comparables_count(0), retained_count(0) {}

MarketStats::MarketStats()
    : count(0), avg_price(0.0), min_price(0.0), max_price(0.0), median_price(0.0) {}

// ============================================================================
// Loading
// ============================================================================

std::vector<Comparable> load_comparables_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open comparables file: " + filepath);
    }
    return load_comparables_from_csv(file);
}

std::vector<Comparable> load_comparables_from_csv(std::istream& is) {
    std::vector<Comparable> comparables;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        Comparable c;
        c.price = parse_csv_number(row[0], "price");
        if (row.size() > 1 && !row[1].empty()) {
            c.mileage_km = parse_csv_number(row[1], "mileage_km");
        }
        if (row.size() > 2) {
            c.source = row[2];
        }
        comparables.push_back(std::move(c));
    }

    return comparables;
}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

std::vector<double> extract_prices(const std::vector<Comparable>& comparables) {
    std::vector<double> prices;
    prices.reserve(comparables.size());
    for (const Comparable& c : comparables) {
        if (!std::isfinite(c.price) || c.price <= 0.0) {
            throw InvalidInput("Comparable price must be a positive number, got " +
                               std::to_string(c.price));
        }
        prices.push_back(c.price);
    }
    return prices;
}

} // anonymous namespace

std::vector<double> filter_outliers_iqr(std::vector<double> prices) {
    std::sort(prices.begin(), prices.end());
    if (prices.size() < IQR_MIN_SAMPLE) {
        return prices;
    }

    size_t n = prices.size();
    size_t q1_idx = static_cast<size_t>(std::floor(static_cast<double>(n) * 0.25));
    size_t q3_idx = static_cast<size_t>(std::floor(static_cast<double>(n) * 0.75));
    double q1 = prices[q1_idx];
    double q3 = prices[q3_idx];
    double iqr = q3 - q1;

    double lower_bound = q1 - 1.5 * iqr;
    double upper_bound = q3 + 1.5 * iqr;

    std::vector<double> retained;
    retained.reserve(n);
    for (double p : prices) {
        if (p >= lower_bound && p <= upper_bound) {
            retained.push_back(p);
        }
    }

    if (retained.empty()) {
        return prices;
    }
    return retained;
}

// ============================================================================
// Estimation
// ============================================================================

MarketEstimate estimate_market_value(const std::vector<Comparable>& comparables) {
    if (comparables.empty()) {
        throw InsufficientData("No comparable vehicles to estimate a market value from");
    }

    std::vector<double> prices = extract_prices(comparables);

    MarketEstimate estimate;
    estimate.comparables_count = prices.size();

    if (prices.size() == 1) {
        estimate.value = prices.front();
        estimate.retained_count = 1;
        estimate.method = "single";
        return estimate;
    }

    if (prices.size() < IQR_MIN_SAMPLE) {
        estimate.value = round_whole(calculate_mean(prices));
        estimate.retained_count = prices.size();
        estimate.method = "mean";
        return estimate;
    }

    std::vector<double> retained = filter_outliers_iqr(std::move(prices));
    estimate.value = round_whole(calculate_mean(retained));
    estimate.retained_count = retained.size();
    estimate.method = "iqr";
    return estimate;
}

MarketStats compute_market_stats(const std::vector<Comparable>& comparables) {
    MarketStats stats;
    if (comparables.empty()) {
        return stats;
    }

    std::vector<double> filtered = filter_outliers_iqr(extract_prices(comparables));

    stats.count = comparables.size();
    stats.avg_price = round_currency(calculate_mean(filtered));
    stats.min_price = filtered.front();
    stats.max_price = filtered.back();
    stats.median_price = filtered[filtered.size() / 2];
    return stats;
}

// ============================================================================
// Estimators
// ============================================================================

MarketEstimate IqrMarketValueEstimator::estimate(const Listing& /* listing */,
                                                 const std::vector<Comparable>& comparables) const {
    return estimate_market_value(comparables);
}

FixedMarketValueEstimator::FixedMarketValueEstimator(double value, std::string source)
    : value_(value), source_(std::move(source)) {
    if (!std::isfinite(value_) || value_ <= 0.0) {
        throw InvalidInput("Market value override must be a positive number");
    }
}

MarketEstimate FixedMarketValueEstimator::estimate(const Listing& /* listing */,
                                                   const std::vector<Comparable>& comparables) const {
    MarketEstimate estimate;
    estimate.value = value_;
    estimate.comparables_count = comparables.size();
    estimate.retained_count = comparables.size();
    estimate.method = source_;
    return estimate;
}

} // namespace importcalc
