#ifndef IMPORTCALC_ERRORS_HPP
#define IMPORTCALC_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace importcalc {

// Malformed or out-of-domain caller input (negative emission, registration
// after evaluation date, unknown fuel label, inverted thresholds, ...)
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& message)
        : std::invalid_argument(message) {}
};

// No comparable listings to estimate a market value from
class InsufficientData : public std::runtime_error {
public:
    explicit InsufficientData(const std::string& message)
        : std::runtime_error(message) {}
};

// Margin percentage requested against a zero or negative total cost
class DivisionUndefined : public std::domain_error {
public:
    explicit DivisionUndefined(const std::string& message)
        : std::domain_error(message) {}
};

// Schedule table violating its ordering/coverage invariants
class ScheduleError : public std::runtime_error {
public:
    explicit ScheduleError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a config, request or table file cannot be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Class name used in logs and batch error records
inline std::string error_kind_name(const std::exception& e) {
    if (dynamic_cast<const InvalidInput*>(&e)) return "InvalidInput";
    if (dynamic_cast<const InsufficientData*>(&e)) return "InsufficientData";
    if (dynamic_cast<const DivisionUndefined*>(&e)) return "DivisionUndefined";
    if (dynamic_cast<const ScheduleError*>(&e)) return "ScheduleError";
    if (dynamic_cast<const ConfigParseError*>(&e)) return "ConfigParseError";
    return "Error";
}

} // namespace importcalc

#endif // IMPORTCALC_ERRORS_HPP
