#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace importcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

// Nullable float64 column filled from successful items only
template <typename Getter>
std::shared_ptr<arrow::Array> amount_column(const BatchResult& batch, const std::string& name,
                                            Getter get) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(batch.items.size())), "reserve " + name + " column");
    for (const BatchItem& item : batch.items) {
        if (item.success) {
            check(builder.Append(get(*item.result)), "append " + name);
        } else {
            check(builder.AppendNull(), "append " + name);
        }
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_batch_results(const BatchResult& batch, const std::string& filepath) {
    // Build Arrow schema
    auto schema = arrow::schema({
        arrow::field("request_id", arrow::utf8()),
        arrow::field("success", arrow::boolean()),
        arrow::field("listing_price", arrow::float64()),
        arrow::field("market_value", arrow::float64()),
        arrow::field("tax_payable", arrow::float64()),
        arrow::field("total_import_costs", arrow::float64()),
        arrow::field("total_cost", arrow::float64()),
        arrow::field("margin", arrow::float64()),
        arrow::field("margin_percentage", arrow::float64()),
        arrow::field("vehicle_age_months", arrow::int32()),
        arrow::field("recommendation", arrow::utf8()),
        arrow::field("error_kind", arrow::utf8()),
        arrow::field("error_message", arrow::utf8())
    });

    arrow::StringBuilder id_builder;
    arrow::BooleanBuilder success_builder;
    arrow::Int32Builder age_builder;
    arrow::StringBuilder recommendation_builder;
    arrow::StringBuilder error_kind_builder;
    arrow::StringBuilder error_message_builder;

    for (const BatchItem& item : batch.items) {
        check(id_builder.Append(item.request_id), "append request_id");
        check(success_builder.Append(item.success), "append success");
        if (item.success) {
            const ArbitrageResult& r = *item.result;
            check(age_builder.Append(r.vehicle_age_months), "append vehicle_age_months");
            check(recommendation_builder.Append(recommendation_to_string(r.recommendation)),
                  "append recommendation");
            check(error_kind_builder.AppendNull(), "append error_kind");
            check(error_message_builder.AppendNull(), "append error_message");
        } else {
            check(age_builder.AppendNull(), "append vehicle_age_months");
            check(recommendation_builder.AppendNull(), "append recommendation");
            check(error_kind_builder.Append(item.error_kind), "append error_kind");
            check(error_message_builder.Append(item.error_message), "append error_message");
        }
    }

    std::shared_ptr<arrow::Array> id_array;
    std::shared_ptr<arrow::Array> success_array;
    std::shared_ptr<arrow::Array> age_array;
    std::shared_ptr<arrow::Array> recommendation_array;
    std::shared_ptr<arrow::Array> error_kind_array;
    std::shared_ptr<arrow::Array> error_message_array;
    check(id_builder.Finish(&id_array), "finish request_id array");
    check(success_builder.Finish(&success_array), "finish success array");
    check(age_builder.Finish(&age_array), "finish vehicle_age_months array");
    check(recommendation_builder.Finish(&recommendation_array), "finish recommendation array");
    check(error_kind_builder.Finish(&error_kind_array), "finish error_kind array");
    check(error_message_builder.Finish(&error_message_array), "finish error_message array");

    // Create Arrow table
    auto table = arrow::Table::Make(schema, {
        id_array,
        success_array,
        amount_column(batch, "listing_price", [](const ArbitrageResult& r) { return r.listing_price; }),
        amount_column(batch, "market_value", [](const ArbitrageResult& r) { return r.market_value; }),
        amount_column(batch, "tax_payable", [](const ArbitrageResult& r) { return r.tax.payable; }),
        amount_column(batch, "total_import_costs",
                      [](const ArbitrageResult& r) { return r.costs.total_import_costs; }),
        amount_column(batch, "total_cost", [](const ArbitrageResult& r) { return r.costs.total_cost; }),
        amount_column(batch, "margin", [](const ArbitrageResult& r) { return r.margin; }),
        amount_column(batch, "margin_percentage",
                      [](const ArbitrageResult& r) { return r.margin_percentage; }),
        age_array,
        recommendation_array,
        error_kind_array,
        error_message_array
    });

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    // Write Parquet file
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 64 * 1024),
          "write Parquet table");

    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_batch_results(const BatchResult& /* batch */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace importcalc
