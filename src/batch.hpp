#ifndef IMPORTCALC_BATCH_HPP
#define IMPORTCALC_BATCH_HPP

#include "arbitrage_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace importcalc {

// Outcome of one request in a batch
struct BatchItem {
    std::string request_id;
    bool success;
    std::optional<ArbitrageResult> result;   // Set when success
    std::string error_kind;                  // "InvalidInput", "InsufficientData", ...
    std::string error_message;

    BatchItem();
};

struct BatchResult {
    std::vector<BatchItem> items;            // Same order as the requests

    size_t succeeded;
    size_t failed;
    size_t go_count;
    size_t consider_count;
    size_t no_go_count;

    double execution_time_ms;

    BatchResult();
};

// Evaluate independent requests against one configuration.
// A failing request is recorded in its BatchItem and never aborts the batch.
// With OpenMP the requests are evaluated in parallel; the engines are pure
// and the configuration is read-only, so no locking is needed.
BatchResult run_batch(const std::vector<ArbitrageRequest>& requests,
                      const ArbitrageConfig& config,
                      const Clock& clock = system_clock());

} // namespace importcalc

#endif // IMPORTCALC_BATCH_HPP
