#ifndef IMPORTCALC_MONEY_HPP
#define IMPORTCALC_MONEY_HPP

namespace importcalc {

// Round a currency amount to cents, half away from zero.
// Applied at every accumulation boundary of the tax and margin calculations,
// not only on the final figure.
double round_currency(double amount);

// Round to whole currency units, half away from zero (market value estimates)
double round_whole(double amount);

} // namespace importcalc

#endif // IMPORTCALC_MONEY_HPP
