#ifndef IMPORTCALC_PARQUET_READER_HPP
#define IMPORTCALC_PARQUET_READER_HPP

#include "../market_value.hpp"
#include <string>
#include <vector>

namespace importcalc {

class ParquetReader {
public:
    /**
     * Load comparable listings from a Parquet file.
     *
     * Expected schema:
     *   - price: float64 (int64/int32/float32 accepted)
     *   - mileage_km: numeric, optional (0 when absent or null)
     *   - source: string, optional
     *   - Other columns are ignored
     *
     * @param filepath Path to Parquet file
     * @return Comparables in file order
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static std::vector<Comparable> load_comparables(const std::string& filepath);
};

} // namespace importcalc

#endif // IMPORTCALC_PARQUET_READER_HPP
