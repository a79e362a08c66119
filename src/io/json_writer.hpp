#ifndef IMPORTCALC_IO_JSON_WRITER_HPP
#define IMPORTCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../arbitrage_engine.hpp"
#include "../batch.hpp"
#include "../market_value.hpp"
#include "../tax_engine.hpp"

namespace importcalc {
namespace io {

// Write a tax breakdown, preceded by the vehicle facts it was computed for
void write_tax_result_json(std::ostream& os, const VehicleFacts& vehicle,
                           const TaxResult& result, bool pretty_print = true);

// Write a full analysis: breakdown, recommendation and comparable statistics
void write_analysis_json(std::ostream& os, const std::string& request_id,
                         const ArbitrageResult& result, const MarketStats& stats,
                         bool pretty_print = true);

// Write every batch item (result or error record) plus summary counts
void write_batch_result_json(std::ostream& os, const BatchResult& batch,
                             bool pretty_print = true);

void write_batch_result_json(const std::string& filepath, const BatchResult& batch,
                             bool pretty_print = true);

// JSON string literal, quotes included
std::string json_quote(const std::string& value);

} // namespace io
} // namespace importcalc

#endif // IMPORTCALC_IO_JSON_WRITER_HPP
