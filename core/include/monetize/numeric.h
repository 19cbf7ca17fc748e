#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "monetize/big_number.h"
#include "monetize/currency.h"
#include "monetize/parser.h"

namespace monetize {

// Entry points for values that are already numbers rather than free-form
// text. A missing currency means the registry default.

ParseResult from_integer(const BigInt& units, const CurrencyRegistry& registry,
                         const std::optional<std::string>& currency = std::nullopt);

// [+-]digits[.digits][e[+-]digits]. Throws InvalidAmount for anything else.
ParseResult from_decimal(std::string_view literal, const CurrencyRegistry& registry,
                         const std::optional<std::string>& currency = std::nullopt,
                         const ParseOptions& options = {});

// Goes through the shortest decimal text that reads back as the same double,
// so 0.1 is treated as "0.1". Throws UnsupportedValueType for NaN and
// infinities.
ParseResult from_double(double value, const CurrencyRegistry& registry,
                        const std::optional<std::string>& currency = std::nullopt,
                        const ParseOptions& options = {});

// Dispatches an integer or decimal literal to the matching entry point.
// Throws UnsupportedValueType when the text is neither.
ParseResult from_numeric(std::string_view literal, const CurrencyRegistry& registry,
                         const std::optional<std::string>& currency = std::nullopt,
                         const ParseOptions& options = {});

std::string shortest_double_text(double value);

}  // namespace monetize
