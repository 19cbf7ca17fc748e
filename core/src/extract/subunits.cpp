#include <cctype>
#include <cstddef>
#include <string>

#include "monetize/errors.h"
#include "monetize/subunits.h"

namespace monetize {

namespace {

void require_digits(const std::string& digits) {
  for (const char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      throw InvalidAmount("invalid currency amount: '" + digits + "' is not a digit string");
    }
  }
}

BigInt digits_value(const std::string& digits) {
  require_digits(digits);
  return BigInt::from_digits(digits);
}

BigInt round_minor_digits(const std::string& minor, std::size_t places) {
  if (minor.size() < places) {
    return digits_value(minor + std::string(places - minor.size(), '0'));
  }
  if (minor.size() > places) {
    BigInt kept = digits_value(minor.substr(0, places));
    if (minor[places] >= '5') {
      kept += BigInt(1L);
    }
    return kept;
  }
  return digits_value(minor);
}

}  // namespace

BigRational compute_subunits(const ParsedAmount& parsed, const CurrencyContext& currency, bool infinite_precision) {
  if (parsed.multiplier_exponent < 0) {
    throw InvalidAmount("negative multiplier exponent");
  }
  const auto shift = static_cast<std::size_t>(parsed.multiplier_exponent);
  require_digits(parsed.minor_digits);

  BigInt whole = digits_value(parsed.major_digits);
  whole *= currency.subunit_to_unit;
  whole *= BigInt::pow10(shift);

  const std::string minor = parsed.minor_digits + std::string(shift, '0');
  BigInt shifted = digits_value(minor.substr(0, shift));
  shifted *= kMultiplierShiftSubunits;
  whole += shifted;

  const std::string rest = minor.substr(shift);
  BigRational total;
  if (infinite_precision) {
    total = BigRational(whole) + BigRational::from_fraction_digits(rest) * BigRational(BigInt(currency.subunit_to_unit));
  } else {
    const auto places = static_cast<std::size_t>(currency.decimal_places < 0 ? 0 : currency.decimal_places);
    whole += round_minor_digits(rest, places);
    total = BigRational(whole);
  }

  return parsed.negative ? -total : total;
}

}  // namespace monetize
