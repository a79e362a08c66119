#ifndef IMPORTCALC_IO_TEXT_REPORT_HPP
#define IMPORTCALC_IO_TEXT_REPORT_HPP

#include <ostream>
#include <string>
#include "../arbitrage_engine.hpp"
#include "../market_value.hpp"
#include "../tax_engine.hpp"

namespace importcalc {
namespace io {

// "EUR 24,500.00"; negative amounts as "EUR -1,234.50"
std::string format_currency(double amount);

// Human-readable import margin analysis (market comparison, cost
// breakdown, tax details and the recommendation)
void write_analysis_report(std::ostream& os, const ArbitrageResult& result,
                           const MarketStats& stats);

void write_tax_report(std::ostream& os, const VehicleFacts& vehicle, const TaxResult& result);

} // namespace io
} // namespace importcalc

#endif // IMPORTCALC_IO_TEXT_REPORT_HPP
