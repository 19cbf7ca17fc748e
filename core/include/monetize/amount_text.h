#pragma once

#include <string>
#include <string_view>

namespace monetize {

struct ParsedAmount {
  std::string major_digits;
  std::string minor_digits = "0";
  bool negative = false;
  int multiplier_exponent = 0;
};

struct CleanedAmount {
  std::string digits;  // digits plus '.', ',' and '\'' separators
  bool negative = false;
};

struct AmountParts {
  std::string major;
  std::string minor;
};

// 3 for a trailing K, 6 for M, 9 for B, 12 for T (case-insensitive). The
// suffix must directly follow a digit and no digit may come after it.
int extract_multiplier_exponent(std::string_view text);

// Drops everything but digits, separators and hyphens, takes the sign from a
// leading or trailing hyphen and chops one trailing '.' or ','. Throws
// InvalidAmount for a hyphen anywhere else.
CleanedAmount clean_amount_text(std::string_view text);

// Splits cleaned digits into whole and fractional parts, deciding for every
// separator whether it groups thousands or marks the decimals. decimal_mark
// is the convention of the resolved currency. Throws InvalidAmount for three
// or more distinct separators.
AmountParts disambiguate_delimiters(const std::string& digits, char decimal_mark);

ParsedAmount extract_amount(std::string_view text, char decimal_mark);

}  // namespace monetize
