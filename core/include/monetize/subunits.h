#pragma once

#include "monetize/amount_text.h"
#include "monetize/big_number.h"
#include "monetize/currency.h"

namespace monetize {

// Each multiplier step pulls one minor digit into the whole-subunit part and
// counts it as a hundred subunits, whatever the currency's own ratio.
inline constexpr long kMultiplierShiftSubunits = 100;

// Signed subunit count for a parsed amount. Without infinite_precision the
// fraction is rounded to the currency's decimal places (half up, deciding on
// the first dropped digit only) and the result is always an integer.
BigRational compute_subunits(const ParsedAmount& parsed, const CurrencyContext& currency, bool infinite_precision);

}  // namespace monetize
