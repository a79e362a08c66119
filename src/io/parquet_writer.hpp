#ifndef IMPORTCALC_PARQUET_WRITER_HPP
#define IMPORTCALC_PARQUET_WRITER_HPP

#include "../batch.hpp"
#include <string>

namespace importcalc {

class ParquetWriter {
public:
    /**
     * Write batch results to a Parquet file, one row per request.
     *
     * Output schema:
     *   - request_id: string
     *   - success: bool
     *   - listing_price, market_value, tax_payable, total_import_costs,
     *     total_cost, margin, margin_percentage: float64 (null on failure)
     *   - vehicle_age_months: int32 (null on failure)
     *   - recommendation: string ("GO", "CONSIDER", "NO_GO"; null on failure)
     *   - error_kind, error_message: string (null on success)
     *
     * @param batch BatchResult to export
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written
     */
    static void write_batch_results(const BatchResult& batch, const std::string& filepath);
};

} // namespace importcalc

#endif // IMPORTCALC_PARQUET_WRITER_HPP
