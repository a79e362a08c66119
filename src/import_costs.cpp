#include "import_costs.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

namespace importcalc {

// ============================================================================
// ImportCosts Implementation
// ============================================================================

ImportCosts::ImportCosts()
    : transport(450.0)
    , rdw_inspection(85.0)
    , license_plates(50.0)
    , handling_fee(200.0)
    , nap_check(12.95)
    , other(0.0) {
}

ImportCosts::ImportCosts(double transport_, double inspection, double plates,
                         double handling, double nap, double other_)
    : transport(transport_)
    , rdw_inspection(inspection)
    , license_plates(plates)
    , handling_fee(handling)
    , nap_check(nap)
    , other(other_) {
}

bool ImportCosts::operator==(const ImportCosts& rhs) const {
    return transport == rhs.transport &&
           rdw_inspection == rhs.rdw_inspection &&
           license_plates == rhs.license_plates &&
           handling_fee == rhs.handling_fee &&
           nap_check == rhs.nap_check &&
           other == rhs.other;
}

double ImportCosts::total() const {
    return transport + rdw_inspection + license_plates + handling_fee + nap_check + other;
}

namespace {

void check_cost(const std::string& name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidInput("Import cost '" + name + "' must be a non-negative number");
    }
}

} // anonymous namespace

void ImportCosts::validate() const {
    check_cost("transport", transport);
    check_cost("rdw_inspection", rdw_inspection);
    check_cost("license_plates", license_plates);
    check_cost("handling_fee", handling_fee);
    check_cost("nap_check", nap_check);
    check_cost("other", other);
}

namespace {

// Shared by ImportCosts and ImportCostOverrides; the fields are double or
// std::optional<double> respectively.
template <typename Items>
void assign_item(Items& items, const std::string& raw_name, double value) {
    std::string name = raw_name;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    check_cost(name, value);

    if (name == "transport") {
        items.transport = value;
    } else if (name == "rdw_inspection" || name == "inspection") {
        items.rdw_inspection = value;
    } else if (name == "license_plates" || name == "registration") {
        items.license_plates = value;
    } else if (name == "handling_fee" || name == "handling") {
        items.handling_fee = value;
    } else if (name == "nap_check" || name == "provenance_check") {
        items.nap_check = value;
    } else if (name == "other") {
        items.other = value;
    } else {
        throw InvalidInput("Unknown import cost item: " + raw_name);
    }
}

} // anonymous namespace

void ImportCosts::set(const std::string& name, double value) {
    assign_item(*this, name, value);
}

ImportCosts ImportCosts::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open import costs file: " + filepath);
    }
    return load_from_csv(file);
}

ImportCosts ImportCosts::load_from_csv(std::istream& is) {
    ImportCosts costs;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw ConfigParseError("Import costs CSV requires columns: name,value");
        }

        costs.set(row[0], parse_csv_number(row[1], "value"));
    }

    return costs;
}

// ============================================================================
// ImportCostOverrides Implementation
// ============================================================================

void ImportCostOverrides::set(const std::string& name, double value) {
    assign_item(*this, name, value);
}

bool ImportCostOverrides::empty() const {
    return !transport && !rdw_inspection && !license_plates &&
           !handling_fee && !nap_check && !other;
}

ImportCosts ImportCostOverrides::apply_to(const ImportCosts& defaults) const {
    ImportCosts merged(transport.value_or(defaults.transport),
                       rdw_inspection.value_or(defaults.rdw_inspection),
                       license_plates.value_or(defaults.license_plates),
                       handling_fee.value_or(defaults.handling_fee),
                       nap_check.value_or(defaults.nap_check),
                       other.value_or(defaults.other));
    merged.validate();
    return merged;
}

} // namespace importcalc
