#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace importcalc {

#ifdef HAVE_ARROW

namespace {

// Numeric cell as double; nulls read as 0
double numeric_value(const arrow::Array& array, int64_t i, const std::string& column) {
    if (array.IsNull(i)) {
        return 0.0;
    }
    switch (array.type_id()) {
        case arrow::Type::DOUBLE:
            return static_cast<const arrow::DoubleArray&>(array).Value(i);
        case arrow::Type::FLOAT:
            return static_cast<const arrow::FloatArray&>(array).Value(i);
        case arrow::Type::INT64:
            return static_cast<double>(static_cast<const arrow::Int64Array&>(array).Value(i));
        case arrow::Type::INT32:
            return static_cast<double>(static_cast<const arrow::Int32Array&>(array).Value(i));
        default:
            throw std::runtime_error("Parquet column '" + column + "' must be numeric, got " +
                                     array.type()->ToString());
    }
}

} // anonymous namespace

std::vector<Comparable> ParquetReader::load_comparables(const std::string& filepath) {
    // Open Parquet file
    auto infile_result = arrow::io::ReadableFile::Open(filepath);
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    // Create Parquet reader
    parquet::arrow::FileReaderBuilder builder;
    auto status = builder.Open(infile);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }
    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    status = builder.memory_pool(arrow::default_memory_pool())->Build(&arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    // Read entire table into memory
    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    // Validate schema
    auto schema = table->schema();
    int price_idx = schema->GetFieldIndex("price");
    int mileage_idx = schema->GetFieldIndex("mileage_km");
    int source_idx = schema->GetFieldIndex("source");

    if (price_idx < 0) {
        throw std::runtime_error("Parquet file missing required column: price");
    }
    if (source_idx >= 0 && schema->field(source_idx)->type()->id() != arrow::Type::STRING) {
        throw std::runtime_error("Parquet column 'source' must be a string column");
    }

    // One chunk per column so rows line up across columns
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    std::vector<Comparable> comparables;
    int64_t num_rows = table->num_rows();
    if (num_rows == 0) {
        return comparables;
    }
    comparables.reserve(static_cast<size_t>(num_rows));

    auto price_column = table->column(price_idx)->chunk(0);
    std::shared_ptr<arrow::Array> mileage_column =
        mileage_idx >= 0 ? table->column(mileage_idx)->chunk(0) : nullptr;
    std::shared_ptr<arrow::StringArray> source_column =
        source_idx >= 0
            ? std::static_pointer_cast<arrow::StringArray>(table->column(source_idx)->chunk(0))
            : nullptr;

    for (int64_t i = 0; i < num_rows; ++i) {
        if (price_column->IsNull(i)) {
            throw std::runtime_error("Parquet column 'price' contains a null value");
        }
        Comparable comp;
        comp.price = numeric_value(*price_column, i, "price");
        if (mileage_column) {
            comp.mileage_km = numeric_value(*mileage_column, i, "mileage_km");
        }
        if (source_column && !source_column->IsNull(i)) {
            comp.source = source_column->GetString(i);
        }
        comparables.push_back(std::move(comp));
    }

    return comparables;
}

#else // !HAVE_ARROW

std::vector<Comparable> ParquetReader::load_comparables(const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace importcalc
