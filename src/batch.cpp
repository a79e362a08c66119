#include "batch.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <exception>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace importcalc {

BatchItem::BatchItem()
    : success(false) {}

BatchResult::BatchResult()
    : succeeded(0),
      failed(0),
      go_count(0),
      consider_count(0),
      no_go_count(0),
      execution_time_ms(0.0) {}

namespace {

void evaluate_item(const ArbitrageRequest& request,
                   const ArbitrageConfig& config,
                   const Clock& clock,
                   BatchItem& item) {
    item.request_id = request.id;
    try {
        item.result = compute_arbitrage(request, config, clock);
        item.success = true;
    } catch (const std::exception& e) {
        item.success = false;
        item.error_kind = error_kind_name(e);
        item.error_message = e.what();
    }
}

} // anonymous namespace

BatchResult run_batch(const std::vector<ArbitrageRequest>& requests,
                      const ArbitrageConfig& config,
                      const Clock& clock) {
    auto start_time = std::chrono::high_resolution_clock::now();

    BatchResult batch;
    batch.items.resize(requests.size());

#ifdef HAVE_OPENMP
    // Each iteration writes only its own slot
    #pragma omp parallel for schedule(dynamic, 16)
    for (size_t i = 0; i < requests.size(); ++i) {
        evaluate_item(requests[i], config, clock, batch.items[i]);
    }
#else
    for (size_t i = 0; i < requests.size(); ++i) {
        evaluate_item(requests[i], config, clock, batch.items[i]);
    }
#endif

    Logger& logger = Logger::get_instance();
    for (const BatchItem& item : batch.items) {
        if (!item.success) {
            batch.failed++;
            logger.log_error(CalculationContext(item.request_id, "batch"),
                             item.error_kind, item.error_message);
            continue;
        }
        batch.succeeded++;
        switch (item.result->recommendation) {
            case Recommendation::Go: batch.go_count++; break;
            case Recommendation::Consider: batch.consider_count++; break;
            case Recommendation::NoGo: batch.no_go_count++; break;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    batch.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    logger.log_batch_complete(CalculationContext("", "batch"),
                              requests.size(), batch.failed, batch.execution_time_ms);

    return batch;
}

} // namespace importcalc
