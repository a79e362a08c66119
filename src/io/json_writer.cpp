#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace importcalc {
namespace io {

std::string json_quote(const std::string& value) {
    std::ostringstream oss;
    oss << '"';
    for (char c : value) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

namespace {

// Streams one JSON object, handling separators and indentation
class ObjectWriter {
public:
    ObjectWriter(std::ostream& os, bool pretty_print, int depth)
        : os_(os), pretty_(pretty_print), depth_(depth), first_(true) {
        os_ << "{";
    }

    void amount(const std::string& name, double value) {
        key(name);
        os_ << std::fixed << std::setprecision(2) << value;
    }

    void count(const std::string& name, long long value) {
        key(name);
        os_ << value;
    }

    void text(const std::string& name, const std::string& value) {
        key(name);
        os_ << json_quote(value);
    }

    void flag(const std::string& name, bool value) {
        key(name);
        os_ << (value ? "true" : "false");
    }

    // Start a nested value; the caller writes it at depth() + 1
    void key(const std::string& name) {
        if (!first_) {
            os_ << ",";
        }
        first_ = false;
        newline(depth_ + 1);
        os_ << json_quote(name) << ":" << (pretty_ ? " " : "");
    }

    void close() {
        if (!first_) {
            newline(depth_);
        }
        os_ << "}";
    }

    int depth() const { return depth_; }
    bool pretty() const { return pretty_; }

private:
    std::ostream& os_;
    bool pretty_;
    int depth_;
    bool first_;

    void newline(int level) {
        if (pretty_) {
            os_ << "\n" << std::string(static_cast<size_t>(level) * 2, ' ');
        }
    }
};

void write_tax_object(std::ostream& os, const TaxResult& tax, bool pretty, int depth) {
    ObjectWriter obj(os, pretty, depth);
    obj.amount("base_amount", tax.base_amount);
    obj.amount("variable_amount", tax.variable_amount);
    obj.amount("gross_amount", tax.gross_amount);
    obj.amount("surcharge", tax.surcharge);
    obj.amount("total_gross", tax.total_gross);
    obj.count("vehicle_age_months", tax.vehicle_age_months);
    obj.amount("depreciation_percentage", tax.depreciation_percentage);
    obj.amount("payable", tax.payable);
    obj.close();
}

void write_costs_object(std::ostream& os, const CostBreakdown& costs, bool pretty, int depth) {
    ObjectWriter obj(os, pretty, depth);
    obj.amount("listing_price", costs.listing_price);
    obj.amount("tax", costs.tax);
    obj.amount("transport", costs.transport);
    obj.amount("rdw_inspection", costs.rdw_inspection);
    obj.amount("license_plates", costs.license_plates);
    obj.amount("handling_fee", costs.handling_fee);
    obj.amount("nap_check", costs.nap_check);
    obj.amount("other", costs.other);
    obj.amount("total_import_costs", costs.total_import_costs);
    obj.amount("total_cost", costs.total_cost);
    obj.close();
}

void write_result_fields(std::ostream& os, ObjectWriter& obj, const ArbitrageResult& result) {
    obj.text("vehicle", result.vehicle_description);
    obj.count("vehicle_age_months", result.vehicle_age_months);
    obj.amount("listing_price", result.listing_price);
    obj.amount("market_value", result.market_value);
    obj.text("market_value_method", result.market_value_method);
    obj.count("comparables_count", static_cast<long long>(result.comparables_count));
    obj.count("comparables_retained", static_cast<long long>(result.comparables_retained));

    obj.key("tax");
    write_tax_object(os, result.tax, obj.pretty(), obj.depth() + 1);

    obj.key("costs");
    write_costs_object(os, result.costs, obj.pretty(), obj.depth() + 1);

    obj.amount("margin", result.margin);
    obj.amount("margin_percentage", result.margin_percentage);
    obj.text("recommendation", recommendation_to_string(result.recommendation));
    obj.amount("quick_sale_price", result.quick_sale_price);
    obj.amount("safe_margin", result.safe_margin);
}

} // anonymous namespace

void write_tax_result_json(std::ostream& os, const VehicleFacts& vehicle,
                           const TaxResult& result, bool pretty_print) {
    ObjectWriter obj(os, pretty_print, 0);

    obj.key("vehicle");
    {
        ObjectWriter v(os, pretty_print, 1);
        v.amount("co2_gkm", vehicle.co2_gkm);
        v.text("fuel_type", fuel_category_to_string(vehicle.fuel));
        v.text("first_registration", vehicle.first_registration.to_string());
        if (vehicle.evaluation_date) {
            v.text("evaluation_date", vehicle.evaluation_date->to_string());
        }
        v.close();
    }

    obj.key("tax");
    write_tax_object(os, result, pretty_print, 1);

    obj.close();
    os << "\n";
}

void write_analysis_json(std::ostream& os, const std::string& request_id,
                         const ArbitrageResult& result, const MarketStats& stats,
                         bool pretty_print) {
    ObjectWriter obj(os, pretty_print, 0);
    if (!request_id.empty()) {
        obj.text("request_id", request_id);
    }
    write_result_fields(os, obj, result);

    obj.key("market_stats");
    {
        ObjectWriter s(os, pretty_print, 1);
        s.count("count", static_cast<long long>(stats.count));
        s.amount("avg_price", stats.avg_price);
        s.amount("min_price", stats.min_price);
        s.amount("max_price", stats.max_price);
        s.amount("median_price", stats.median_price);
        s.close();
    }

    obj.close();
    os << "\n";
}

void write_batch_result_json(std::ostream& os, const BatchResult& batch, bool pretty_print) {
    ObjectWriter obj(os, pretty_print, 0);

    obj.key("summary");
    {
        ObjectWriter s(os, pretty_print, 1);
        s.count("requests", static_cast<long long>(batch.items.size()));
        s.count("succeeded", static_cast<long long>(batch.succeeded));
        s.count("failed", static_cast<long long>(batch.failed));
        s.count("go", static_cast<long long>(batch.go_count));
        s.count("consider", static_cast<long long>(batch.consider_count));
        s.count("no_go", static_cast<long long>(batch.no_go_count));
        s.amount("execution_time_ms", batch.execution_time_ms);
        s.close();
    }

    obj.key("results");
    os << "[";
    const std::string item_pad = pretty_print ? "\n    " : "";
    for (size_t i = 0; i < batch.items.size(); ++i) {
        const BatchItem& item = batch.items[i];
        if (i > 0) {
            os << ",";
        }
        os << item_pad;

        ObjectWriter entry(os, pretty_print, 2);
        entry.text("request_id", item.request_id);
        entry.flag("success", item.success);
        if (item.success) {
            write_result_fields(os, entry, *item.result);
        } else {
            entry.text("error_kind", item.error_kind);
            entry.text("error_message", item.error_message);
        }
        entry.close();
    }
    if (pretty_print && !batch.items.empty()) {
        os << "\n  ";
    }
    os << "]";

    obj.close();
    os << "\n";
}

void write_batch_result_json(const std::string& filepath, const BatchResult& batch,
                             bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_batch_result_json(file, batch, pretty_print);
}

} // namespace io
} // namespace importcalc
