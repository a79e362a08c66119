#ifndef IMPORTCALC_IMPORT_COSTS_HPP
#define IMPORTCALC_IMPORT_COSTS_HPP

#include <istream>
#include <optional>
#include <string>

namespace importcalc {

// ImportCosts: fixed cost line items of bringing a vehicle across the border
struct ImportCosts {
    double transport;          // DE -> NL transport
    double rdw_inspection;     // RDW keuring
    double license_plates;     // Registration / kenteken
    double handling_fee;       // Dealer handling
    double nap_check;          // Odometer provenance check
    double other;

    // Default 2026 line items (other = 0)
    ImportCosts();
    ImportCosts(double transport, double inspection, double plates,
                double handling, double nap, double other = 0.0);

    bool operator==(const ImportCosts& other) const;

    // Sum of all line items
    double total() const;

    // Throws InvalidInput if any line item is negative or not finite
    void validate() const;

    // CSV format: name,value pairs
    //   transport,450
    //   rdw_inspection,85
    // Unlisted items keep their default value
    static ImportCosts load_from_csv(const std::string& filepath);
    static ImportCosts load_from_csv(std::istream& is);

    // Set a line item by name (accepts short aliases such as "inspection").
    // Throws InvalidInput for unknown names or negative values.
    void set(const std::string& name, double value);
};

// Per-item overrides; unset items fall back to the configured defaults
struct ImportCostOverrides {
    std::optional<double> transport;
    std::optional<double> rdw_inspection;
    std::optional<double> license_plates;
    std::optional<double> handling_fee;
    std::optional<double> nap_check;
    std::optional<double> other;

    // Same names and checks as ImportCosts::set
    void set(const std::string& name, double value);

    bool empty() const;

    // Merge over defaults item by item. The built-in defaults carry no
    // "other" amount, so an unset "other" is zero unless configured.
    ImportCosts apply_to(const ImportCosts& defaults) const;
};

} // namespace importcalc

#endif // IMPORTCALC_IMPORT_COSTS_HPP
