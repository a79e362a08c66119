#include "money.hpp"
#include <cmath>

namespace importcalc {

double round_currency(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

double round_whole(double amount) {
    return std::round(amount);
}

} // namespace importcalc
