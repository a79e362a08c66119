#ifndef IMPORTCALC_IO_REQUEST_PARSER_HPP
#define IMPORTCALC_IO_REQUEST_PARSER_HPP

#include <string>
#include <vector>
#include "../arbitrage_engine.hpp"

namespace importcalc {
namespace io {

// Parse one analysis request:
//   {
//     "id": "req-1",
//     "listing": {"price": 24500, "co2_gkm": 118, "fuel_type": "diesel",
//                 "first_registration": "2022-03-15", "evaluation_date": "2026-01-10",
//                 "mileage_km": 62000, "make": "Volkswagen", "model": "Golf",
//                 "year": 2022, "source": "mobile.de"},
//     "comparables": [{"price": 27900, "mileage_km": 58000, "source": "marktplaats"}, 28500],
//     "import_costs": {"transport": 600},
//     "thresholds": {"go": 3000, "consider": 1500},
//     "market_value_override": 29000
//   }
// Throws ConfigParseError for malformed JSON, InvalidInput for missing or
// out-of-domain fields (unknown fuel label, impossible dates, ...).
ArbitrageRequest parse_request_from_string(const std::string& json_string);
ArbitrageRequest parse_request_from_file(const std::string& filepath);

// A batch is a JSON array of requests or {"requests": [...]}. Requests
// without an "id" are numbered by position ("1", "2", ...).
std::vector<ArbitrageRequest> parse_batch_from_string(const std::string& json_string);
std::vector<ArbitrageRequest> parse_batch_from_file(const std::string& filepath);

} // namespace io
} // namespace importcalc

#endif // IMPORTCALC_IO_REQUEST_PARSER_HPP
